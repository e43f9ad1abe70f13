#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace dispatch::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : conn_(pool->Acquire()), work_(std::make_unique<pqxx::work>(*conn_)) {
}

PgTransaction::~PgTransaction() {
  if (!open_) return;

  try {
    work_->abort();
  } catch (const pqxx::failure& e) {
    DISPATCH_LOG_ERROR("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  if (!open_) return;

  // pqxx forbids touching the work again after a failed commit.
  open_ = false;
  try {
    work_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw TransactionConflict(std::string("postgres commit: ") + e.what());
  } catch (const pqxx::deadlock_detected& e) {
    throw TransactionConflict(std::string("postgres commit: ") + e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  if (!open_) return;

  open_ = false;
  work_->abort();
}

} // namespace dispatch::db::postgres
