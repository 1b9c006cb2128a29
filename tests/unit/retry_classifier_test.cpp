#include "internal/recovery/retry_classifier.hpp"

#include <cassert>
#include <iostream>

#include "internal/config/config_loader.hpp"

namespace {

relay::recovery::RetryClassifier DefaultClassifier() {
  relay::runtime::config::RuntimeConfig config;
  relay::config::ConfigLoader::ApplyDefaults(config);

  const auto& recovery = config.recovery();
  return relay::recovery::RetryClassifier({recovery.transient_markers().begin(), recovery.transient_markers().end()},
                                          recovery.max_attempts());
}

void TestTransientErrorsAreRetriedUntilMaxAttempts() {
  const auto classifier = DefaultClassifier();

  assert(classifier.ShouldRetry(1, "Connection reset by peer"));
  assert(classifier.ShouldRetry(2, "ERROR: unable to download video data: HTTP Error 503: Service Unavailable"));
  assert(classifier.ShouldRetry(1, "Read timed out."));
  // attempts exhausted
  assert(!classifier.ShouldRetry(3, "Connection reset by peer"));
  assert(!classifier.ShouldRetry(7, "Connection reset by peer"));
}

void TestPermanentErrorsAreNeverRetried() {
  const auto classifier = DefaultClassifier();

  assert(!classifier.ShouldRetry(1, "HTTP Error 404: Not Found"));
  assert(!classifier.ShouldRetry(0, "Video unavailable. This video is private"));
  assert(!classifier.ShouldRetry(1, "Local file not found"));
  assert(!classifier.ShouldRetry(1, ""));
}

void TestMatchingIgnoresCase() {
  relay::recovery::RetryClassifier classifier({"connection reset"}, 5);
  assert(classifier.IsTransient("CONNECTION RESET"));
  assert(classifier.IsTransient("[Errno 104] Connection reset by peer"));
  assert(!classifier.IsTransient("connection refused"));
}

} // namespace

int main() {
  TestTransientErrorsAreRetriedUntilMaxAttempts();
  TestPermanentErrorsAreNeverRetried();
  TestMatchingIgnoresCase();

  std::cout << "relay_manager_unit_retry_classifier: pass\n";
  return 0;
}
