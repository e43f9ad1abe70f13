#pragma once

#include <stdexcept>
#include <string>

namespace dispatch::util {

/*
  Central error types.

  Every error carries a stable machine-readable code. The gRPC layer
  maps the class to a status code and prefixes the message with the code.
*/

class Error : public std::runtime_error {
 public:
  Error(std::string code, const std::string& msg) : std::runtime_error(msg), code_(std::move(code)) {
  }

  const std::string& code() const noexcept {
    return code_;
  }

 private:
  std::string code_;
};

class NotFound : public Error {
 public:
  NotFound(std::string code, const std::string& msg) : Error(std::move(code), msg) {
  }
};

class AlreadyExists : public Error {
 public:
  AlreadyExists(std::string code, const std::string& msg) : Error(std::move(code), msg) {
  }
};

class Conflict : public Error {
 public:
  Conflict(std::string code, const std::string& msg) : Error(std::move(code), msg) {
  }
};

class ValidationFailed : public Error {
 public:
  ValidationFailed(std::string code, const std::string& msg) : Error(std::move(code), msg) {
  }
};

class DriverOffline : public Error {
 public:
  explicit DriverOffline(const std::string& msg) : Error("DRIVER_OFFLINE", msg) {
  }
};

class Unauthorized : public Error {
 public:
  explicit Unauthorized(const std::string& msg) : Error("UNAUTHORIZED", msg) {
  }
};

class Forbidden : public Error {
 public:
  explicit Forbidden(const std::string& msg) : Error("FORBIDDEN", msg) {
  }
};

/*
  Raised by the geo primary path on timeout or backend failure.
  Never crosses a service boundary; GeoIndex recovers through the fallback.
*/
class ServiceDegraded : public std::runtime_error {
 public:
  explicit ServiceDegraded(const std::string& msg) : std::runtime_error(msg) {
  }
};

inline NotFound OrderNotFound(const std::string& order_id) {
  return NotFound("ORDER_NOT_FOUND", "order " + order_id + " not found");
}

inline NotFound DriverNotFound(const std::string& driver_id) {
  return NotFound("DRIVER_NOT_FOUND", "driver " + driver_id + " not found; register the driver first");
}

inline AlreadyExists DriverAlreadyExists(const std::string& driver_id) {
  return AlreadyExists("DRIVER_ALREADY_EXISTS", "driver " + driver_id + " is already registered");
}

inline Conflict OrderNoLongerAvailable(const std::string& order_id) {
  return Conflict("ORDER_NO_LONGER_AVAILABLE", "order " + order_id + " is no longer available");
}

inline Conflict OrderAlreadyCompleted(const std::string& order_id) {
  return Conflict("ORDER_ALREADY_COMPLETED", "order " + order_id + " is already completed");
}

inline Conflict DriverBusy(const std::string& driver_id, const std::string& order_id) {
  return Conflict("DRIVER_BUSY", "driver " + driver_id + " is already on order " + order_id);
}

inline Conflict AlreadyRated(const std::string& order_id) {
  return Conflict("ALREADY_RATED", "order " + order_id + " was already rated by this user");
}

inline ValidationFailed InvalidOtp() {
  return ValidationFailed("INVALID_OTP", "one-time code does not match");
}

inline ValidationFailed InvalidStatusTransition(const std::string& from, const std::string& to) {
  return ValidationFailed("INVALID_STATUS_TRANSITION", "cannot move order from " + from + " to " + to);
}

inline ValidationFailed UnknownVehicleClass(const std::string& code) {
  return ValidationFailed("UNKNOWN_VEHICLE_CLASS", "unknown vehicle class '" + code + "'");
}

inline ValidationFailed InvalidInput(const std::string& msg) {
  return ValidationFailed("INVALID_INPUT", msg);
}

} // namespace dispatch::util
