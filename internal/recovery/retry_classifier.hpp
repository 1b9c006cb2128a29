#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace relay::recovery {

/*
  Allow-list of transient failures.

  An error is retried only when its text contains one of the markers
  (case-insensitive) and the attempt budget is not spent. Everything
  else stays terminal.
*/
class RetryClassifier {
 public:
  RetryClassifier(std::vector<std::string> markers, uint32_t max_attempts);

  bool IsTransient(const std::string& error) const;

  bool ShouldRetry(uint32_t attempts, const std::string& error) const;

  uint32_t MaxAttempts() const {
    return max_attempts_;
  }

 private:
  std::vector<std::string> markers_;
  uint32_t                 max_attempts_;
};

} // namespace relay::recovery
