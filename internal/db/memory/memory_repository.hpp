#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace dispatch::db::memory {

class MemoryTransaction;

/*
  In-process backend. Each transaction works on a private copy of the
  committed state; Commit() fails with TransactionConflict if another
  transaction committed in between, which gives the compare-and-set
  operations the same single-winner behavior as the SQL backends.
*/
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                             InsertOrder(Transaction&, const model::OrderRecord&) override;
  std::optional<model::OrderRecord>  GetOrder(Transaction&, const std::string&) override;
  Result                             UpdateOrderIfStatus(Transaction&, const model::OrderRecord&, dispatch::core::v1::OrderStatus) override;
  Result                             AssignDriverIfPending(Transaction&, const std::string&, const std::string&, uint64_t) override;
  Result                             RestartSearch(Transaction&, const std::string&, uint64_t) override;
  Result                             ClaimSearchExpiry(Transaction&, const std::string&, uint64_t, uint64_t) override;
  std::vector<model::OrderRecord>    ListExpiredSearches(Transaction&, uint64_t, uint32_t) override;
  std::optional<model::OrderRecord>  FindActiveOrderForRider(Transaction&, const std::string&) override;
  std::optional<model::OrderRecord>  FindActiveOrderForDriver(Transaction&, const std::string&) override;
  std::vector<model::OrderRecord>    ListOrdersForParticipant(Transaction&, const std::string&, uint32_t, uint32_t) override;
  uint64_t                           CountOrdersForParticipant(Transaction&, const std::string&) override;

  Result                             InsertDriver(Transaction&, const model::DriverRecord&) override;
  std::optional<model::DriverRecord> GetDriver(Transaction&, const std::string&) override;
  Result                             UpdateDriver(Transaction&, const model::DriverRecord&) override;
  std::vector<model::DriverRecord>   ListOnlineDriversInBox(Transaction&, double, double, double, double) override;
  model::DriverOrderStats            GetDriverOrderStats(Transaction&, const std::string&) override;

  Result                             InsertDecline(Transaction&, const model::DeclineRecord&) override;
  std::vector<model::DeclineRecord>  ListDeclines(Transaction&, const std::string&) override;

  Result                                InsertOrderEvent(Transaction&, const model::OrderEventRecord&) override;
  std::vector<model::OrderEventRecord>  ListOrderEvents(Transaction&, const std::string&) override;

  Result                            InsertRating(Transaction&, const model::RatingRecord&) override;
  std::vector<model::RatingRecord>  ListRatingsFor(Transaction&, const std::string&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::OrderRecord>  orders;
    std::unordered_map<std::string, model::DriverRecord> drivers;
    std::vector<model::DeclineRecord>                    declines;
    std::vector<model::OrderEventRecord>                 events;
    std::vector<model::RatingRecord>                     ratings;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace dispatch::db::memory
