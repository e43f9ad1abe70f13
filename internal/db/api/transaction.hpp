#pragma once

#include <stdexcept>
#include <string>

namespace dispatch::db {

/*
  Unit of work against a Repository.

  Writes stay invisible to other transactions until Commit(). Destroying an
  unfinished transaction rolls it back. Commit() and Rollback() are no-ops
  once the transaction has finished.

  Isolation per backend: memory works on a snapshot copy with optimistic
  commit, SQLite takes the write lock at BEGIN IMMEDIATE, PostgreSQL runs
  a pqxx::work at the server's default isolation plus row-level guards in
  the conditional updates.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  // Throws TransactionConflict when a concurrent writer won.
  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

// Lost a race against another transaction. The whole unit of work may be retried from Begin().
class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace dispatch::db
