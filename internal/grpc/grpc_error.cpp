#include "grpc_error.hpp"

#include <string>

namespace dispatch::grpc {

namespace {

::grpc::Status WithCode(::grpc::StatusCode status, const dispatch::util::Error& e) {
  return {status, e.code() + ": " + e.what()};
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  using namespace dispatch::util;

  if (const auto* err = dynamic_cast<const NotFound*>(&e)) {
    return WithCode(::grpc::StatusCode::NOT_FOUND, *err);
  }
  if (const auto* err = dynamic_cast<const AlreadyExists*>(&e)) {
    return WithCode(::grpc::StatusCode::ALREADY_EXISTS, *err);
  }
  if (const auto* err = dynamic_cast<const Conflict*>(&e)) {
    return WithCode(::grpc::StatusCode::ABORTED, *err);
  }
  if (const auto* err = dynamic_cast<const ValidationFailed*>(&e)) {
    return WithCode(::grpc::StatusCode::INVALID_ARGUMENT, *err);
  }
  if (const auto* err = dynamic_cast<const DriverOffline*>(&e)) {
    return WithCode(::grpc::StatusCode::FAILED_PRECONDITION, *err);
  }
  if (const auto* err = dynamic_cast<const Unauthorized*>(&e)) {
    return WithCode(::grpc::StatusCode::UNAUTHENTICATED, *err);
  }
  if (const auto* err = dynamic_cast<const Forbidden*>(&e)) {
    return WithCode(::grpc::StatusCode::PERMISSION_DENIED, *err);
  }

  return {::grpc::StatusCode::INTERNAL, std::string("INTERNAL_ERROR: ") + e.what()};
}

} // namespace dispatch::grpc
