#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace dispatch::db::sqlite {

/*
  BEGIN IMMEDIATE takes the write lock up front, so two processes running
  the same compare-and-set apply it one after the other instead of both
  reading PENDING. The connection's TxMutex is held until the transaction
  finishes; never open a second one on the same thread.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const {
    return db_->Handle();
  }

  // SQLITE_BUSY becomes TransactionConflict; any other failure is a SqliteError.
  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return state_ == State::kCommitted;
  }

 private:
  enum class State {
    kOpen,
    kCommitted,
    kRolledBack,
  };

  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  State                        state_ = State::kOpen;
};

} // namespace dispatch::db::sqlite
