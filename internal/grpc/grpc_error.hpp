#pragma once

#include <grpcpp/grpcpp.h>

#include "internal/util/errors.hpp"

namespace dispatch::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  The message is prefixed with the machine-readable code,
  e.g. "ORDER_NO_LONGER_AVAILABLE: order 42 is no longer available".
*/

::grpc::Status ToStatus(const std::exception& e);

// Runs fn() for a unary handler; OK unless it throws.
template <typename Fn>
::grpc::Status Guarded(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace dispatch::grpc
