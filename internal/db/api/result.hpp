#pragma once

#include <string>

namespace dispatch::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

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

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "OK";
    case ErrorCode::NotFound:
      return "NOT_FOUND";
    case ErrorCode::AlreadyExists:
      return "ALREADY_EXISTS";
    case ErrorCode::Conflict:
      return "CONFLICT";
    case ErrorCode::Busy:
      return "BUSY";
    case ErrorCode::ConstraintViolation:
      return "CONSTRAINT_VIOLATION";
    case ErrorCode::SerializationFailure:
      return "SERIALIZATION_FAILURE";
    case ErrorCode::IOError:
      return "IO_ERROR";
    case ErrorCode::Corruption:
      return "CORRUPTION";
    case ErrorCode::InternalError:
      return "INTERNAL_ERROR";
  }
  return "UNKNOWN";
}

} // namespace dispatch::db
