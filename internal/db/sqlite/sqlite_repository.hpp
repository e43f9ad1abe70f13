#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace dispatch::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  // NotFound or Conflict after a conditional UPDATE touched no row
  static Result MissOrConflict(sqlite3* db, const std::string& order_id);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace dispatch::db::sqlite
