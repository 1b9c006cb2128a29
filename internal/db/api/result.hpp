#pragma once

#include <string>

namespace relay::db {

/*
  Backend-neutral outcome of a repository write.

  Backends translate sqlite3 / pqxx failures into these codes; the stores
  turn anything other than NotFound / AlreadyExists into util::StoreError.
*/

enum class ErrorCode {
  OK = 0,

  // row-level
  NotFound,
  AlreadyExists,
  ConstraintViolation,

  // retryable by the caller
  Busy,
  SerializationFailure,

  // storage
  IOError,
  Corruption,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace relay::db
