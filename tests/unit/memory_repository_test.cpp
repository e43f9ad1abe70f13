#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "internal/db/api/tx_helpers.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "repository_contract.hpp"

namespace {

using namespace dispatch;
using dispatch::testing::Load;
using dispatch::testing::MakeOrder;
using dispatch::testing::Seed;

void TestContract() {
  db::memory::MemoryRepository repo;
  testing::RunRepositoryContract(repo);
}

void TestReadsSeeOwnWritesOnly() {
  db::memory::MemoryRepository repo;

  auto writer = repo.Begin();
  const auto inserted = repo.InsertOrder(*writer, MakeOrder("o-1", "rider-1", 1000));
  assert(inserted);
  assert(repo.GetOrder(*writer, "o-1").has_value());

  auto reader = repo.Begin();
  assert(!repo.GetOrder(*reader, "o-1").has_value());

  writer->Commit();
  assert(writer->IsCommitted());

  // snapshot taken before the commit stays stable
  assert(!repo.GetOrder(*reader, "o-1").has_value());
  reader->Commit();

  auto later = repo.Begin();
  assert(repo.GetOrder(*later, "o-1").has_value());
}

void TestConcurrentCommitConflicts() {
  db::memory::MemoryRepository repo;
  Seed(repo, MakeOrder("o-race", "rider-1", 1000));

  auto first  = repo.Begin();
  auto second = repo.Begin();

  // both see PENDING in their snapshot
  assert(repo.AssignDriverIfPending(*first, "o-race", "driver-a", 2000));
  assert(repo.AssignDriverIfPending(*second, "o-race", "driver-b", 2001));

  first->Commit();

  bool conflicted = false;
  try {
    second->Commit();
  } catch (const db::TransactionConflict&) {
    conflicted = true;
  }
  assert(conflicted);
  assert(Load(repo, "o-race").driver_id == "driver-a");
}

void TestReadOnlyCommitNeverConflicts() {
  db::memory::MemoryRepository repo;

  auto reader = repo.Begin();
  assert(!repo.GetOrder(*reader, "o-1").has_value());

  Seed(repo, MakeOrder("o-1", "rider-1", 1000));
  reader->Commit();
  assert(reader->IsCommitted());
}

void TestRetryResolvesRacingAccepts() {
  auto repo = std::make_shared<db::memory::MemoryRepository>();
  Seed(*repo, MakeOrder("o-hot", "rider-1", 1000));

  std::atomic<int> winners{0};
  std::atomic<int> losers{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] {
      try {
        db::WithRetry("assign", [&] {
          auto tx = repo->Begin();
          db::ThrowIfError(repo->AssignDriverIfPending(*tx, "o-hot", "driver-" + std::to_string(i), 2000), "assign");
          tx->Commit();
        });
        winners++;
      } catch (const util::Conflict&) {
        losers++;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(winners == 1);
  assert(losers == 7);
  assert(Load(*repo, "o-hot").status == dispatch::core::v1::ORDER_STATUS_DRIVER_ASSIGNED);
}

void TestThrowIfErrorMapsCodes() {
  auto expect_code = [](db::ErrorCode code, const std::string& expected) {
    try {
      db::ThrowIfError(db::Result::Err(code, "boom"), "op");
      assert(false);
    } catch (const util::Error& e) {
      assert(e.code() == expected);
    }
  };
  expect_code(db::ErrorCode::NotFound, "NOT_FOUND");
  expect_code(db::ErrorCode::AlreadyExists, "ALREADY_EXISTS");
  expect_code(db::ErrorCode::Conflict, "CONFLICT");

  bool replayable = false;
  try {
    db::ThrowIfError(db::Result::Err(db::ErrorCode::Busy), "op");
  } catch (const db::TransactionConflict&) {
    replayable = true;
  }
  assert(replayable);

  db::ThrowIfError(db::Result::Ok(), "op");
}

} // namespace

int main() {
  TestContract();
  TestReadsSeeOwnWritesOnly();
  TestConcurrentCommitConflicts();
  TestReadOnlyCommitNeverConflicts();
  TestRetryResolvesRacingAccepts();
  TestThrowIfErrorMapsCodes();
  std::cout << "memory_repository_test: pass\n";
  return 0;
}
