#include "grpc_error.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace relay::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace relay::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e) || dynamic_cast<const InvariantViolation*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  // QuotaExceeded derives from ResourceExhausted
  if (dynamic_cast<const ResourceExhausted*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  if (dynamic_cast<const StoreError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const std::invalid_argument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace relay::grpc
