#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace dispatch::db {

// Optimistic commits are retried this many times before giving up.
inline constexpr int kMaxCommitAttempts = 3;

/*
  Translates a repository Result into the error taxonomy. Busy and
  serialization failures become TransactionConflict so WithRetry can
  replay the unit of work.
*/
inline void ThrowIfError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists("ALREADY_EXISTS", message);
    case ErrorCode::NotFound:
      throw util::NotFound("NOT_FOUND", message);
    case ErrorCode::Conflict:
      throw util::Conflict("CONFLICT", message);
    case ErrorCode::Busy:
    case ErrorCode::SerializationFailure:
      throw TransactionConflict(message);
    default:
      throw std::runtime_error(message);
  }
}

// Runs fn, replaying it from the start when its commit loses a race.
template <typename Fn>
auto WithRetry(const char* op, Fn fn) -> decltype(fn()) {
  for (int attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const TransactionConflict& e) {
      if (attempt >= kMaxCommitAttempts) {
        throw util::Conflict("CONCURRENT_UPDATE", std::string(op) + " kept losing to concurrent writers: " + e.what());
      }
      DISPATCH_LOG_DEBUG("retrying after commit conflict", {observability::StringField("op", op), observability::IntField("attempt", attempt)});
    }
  }
}

} // namespace dispatch::db
