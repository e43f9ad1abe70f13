#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace dispatch::db::memory {

/*
  Private copy of the committed state taken at Begin(), plus the version it
  was taken at. Reads always see that copy with this transaction's own
  writes applied. A commit that wrote nothing never conflicts.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  const MemoryRepository::State& Read() const {
    return working_;
  }

  // Marks the transaction as a writer. Throws once it has finished.
  MemoryRepository::State& Write();

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                base_version_ = 0;
  bool                    wrote_        = false;
  bool                    finished_     = false;
  bool                    committed_    = false;
};

} // namespace dispatch::db::memory
