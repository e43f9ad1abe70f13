#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace dispatch::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result                            InsertOrder(Transaction&, const model::OrderRecord&) override;
  std::optional<model::OrderRecord> GetOrder(Transaction&, const std::string&) override;
  Result                            UpdateOrderIfStatus(Transaction&, const model::OrderRecord&, dispatch::core::v1::OrderStatus) override;
  Result                            AssignDriverIfPending(Transaction&, const std::string&, const std::string&, uint64_t) override;
  Result                            RestartSearch(Transaction&, const std::string&, uint64_t) override;
  Result                            ClaimSearchExpiry(Transaction&, const std::string&, uint64_t, uint64_t) override;
  std::vector<model::OrderRecord>   ListExpiredSearches(Transaction&, uint64_t, uint32_t) override;
  std::optional<model::OrderRecord> FindActiveOrderForRider(Transaction&, const std::string&) override;
  std::optional<model::OrderRecord> FindActiveOrderForDriver(Transaction&, const std::string&) override;
  std::vector<model::OrderRecord>   ListOrdersForParticipant(Transaction&, const std::string&, uint32_t, uint32_t) override;
  uint64_t                          CountOrdersForParticipant(Transaction&, const std::string&) override;

  Result                             InsertDriver(Transaction&, const model::DriverRecord&) override;
  std::optional<model::DriverRecord> GetDriver(Transaction&, const std::string&) override;
  Result                             UpdateDriver(Transaction&, const model::DriverRecord&) override;
  std::vector<model::DriverRecord>   ListOnlineDriversInBox(Transaction&, double, double, double, double) override;
  model::DriverOrderStats            GetDriverOrderStats(Transaction&, const std::string&) override;

  Result                            InsertDecline(Transaction&, const model::DeclineRecord&) override;
  std::vector<model::DeclineRecord> ListDeclines(Transaction&, const std::string&) override;

  Result                               InsertOrderEvent(Transaction&, const model::OrderEventRecord&) override;
  std::vector<model::OrderEventRecord> ListOrderEvents(Transaction&, const std::string&) override;

  Result                           InsertRating(Transaction&, const model::RatingRecord&) override;
  std::vector<model::RatingRecord> ListRatingsFor(Transaction&, const std::string&) override;

 private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception& e);
  static Result         MissOrConflict(pqxx::work& w, const std::string& order_id);
};

} // namespace dispatch::db::postgres
