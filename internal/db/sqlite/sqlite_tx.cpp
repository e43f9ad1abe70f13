#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace dispatch::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  try {
    db_->Exec("BEGIN IMMEDIATE;");
  } catch (const SqliteError& e) {
    if (e.code() == SQLITE_BUSY || e.code() == SQLITE_LOCKED) {
      throw TransactionConflict(std::string("sqlite begin: ") + e.what());
    }
    throw;
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (state_ != State::kOpen) return;

  try {
    db_->Exec("ROLLBACK;");
  } catch (const SqliteError& e) {
    DISPATCH_LOG_ERROR("sqlite rollback failed", {observability::StringField("path", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (state_ != State::kOpen) return;

  try {
    db_->Exec("COMMIT;");
  } catch (const SqliteError& e) {
    // A failed COMMIT leaves the transaction open; the destructor rolls it back.
    if (e.code() == SQLITE_BUSY || e.code() == SQLITE_LOCKED) {
      throw TransactionConflict(std::string("sqlite commit: ") + e.what());
    }
    throw;
  }
  state_ = State::kCommitted;
}

void SqliteTransaction::Rollback() {
  if (state_ != State::kOpen) return;

  state_ = State::kRolledBack;
  db_->Exec("ROLLBACK;");
}

} // namespace dispatch::db::sqlite
