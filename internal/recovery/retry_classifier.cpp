#include "retry_classifier.hpp"

#include "internal/util/strings.hpp"

namespace relay::recovery {

RetryClassifier::RetryClassifier(std::vector<std::string> markers, uint32_t max_attempts)
    : markers_(std::move(markers)), max_attempts_(max_attempts) {
}

bool RetryClassifier::IsTransient(const std::string& error) const {
  if (error.empty()) return false;

  for (const auto& marker : markers_) {
    if (!marker.empty() && util::ContainsIgnoreCase(error, marker)) return true;
  }
  return false;
}

bool RetryClassifier::ShouldRetry(uint32_t attempts, const std::string& error) const {
  return attempts < max_attempts_ && IsTransient(error);
}

} // namespace relay::recovery
