#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace dispatch::db::postgres {

// pqxx::work on a pooled connection. The connection goes back to the pool with the transaction.
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  pqxx::work& Work() {
    return *work_;
  }

  // Serialization failures and deadlocks become TransactionConflict.
  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       work_;
  bool                              open_      = true;
  bool                              committed_ = false;
};

} // namespace dispatch::db::postgres
