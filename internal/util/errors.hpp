#pragma once

#include <stdexcept>
#include <string>

namespace relay::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Provider refused a call because the daily quota is spent.
class QuotaExceeded : public ResourceExhausted {
 public:
  explicit QuotaExceeded(const std::string& msg) : ResourceExhausted(msg) {
  }
};

// Persisted state contradicts what a job requires (e.g. relay without a local file).
class InvariantViolation : public std::runtime_error {
 public:
  explicit InvariantViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Backend failure surfaced from db::Result.
class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace relay::util
