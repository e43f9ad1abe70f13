#include "memory_tx.hpp"

#include <stdexcept>
#include <string>

namespace dispatch::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

MemoryRepository::State& MemoryTransaction::Write() {
  if (finished_) {
    throw std::logic_error("write on a finished memory transaction");
  }
  wrote_ = true;
  return working_;
}

void MemoryTransaction::Commit() {
  if (finished_) return;

  if (wrote_) {
    std::scoped_lock lock(repo_.mutex_);
    if (repo_.committed_version_ != base_version_) {
      throw TransactionConflict("memory commit: state changed since version " + std::to_string(base_version_));
    }
    repo_.committed_ = std::move(working_);
    ++repo_.committed_version_;
  }
  finished_  = true;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  finished_ = true;
}

} // namespace dispatch::db::memory
