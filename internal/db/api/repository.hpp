#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/decline_record.hpp"
#include "internal/db/model/driver_record.hpp"
#include "internal/db/model/driver_stats.hpp"
#include "internal/db/model/order_event_record.hpp"
#include "internal/db/model/order_record.hpp"
#include "internal/db/model/rating_record.hpp"

namespace dispatch::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - The *If* operations are single conditional writes at the storage
    layer (UPDATE ... WHERE status=?), never read-then-write. Two
    drivers accepting the same order from different processes must
    not both succeed.

  The DB is the source of truth for:
    orders and their lifecycle
    drivers, including their last known position
    decline / event / rating history
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Orders
  // ---------------------------------------------------------------------

  virtual Result InsertOrder(Transaction&, const model::OrderRecord&) = 0;

  virtual std::optional<model::OrderRecord> GetOrder(Transaction&, const std::string& id) = 0;

  // Full-row write, applied only while the stored status equals `expected`.
  // NotFound when the order is absent, Conflict when the status moved.
  virtual Result UpdateOrderIfStatus(Transaction&, const model::OrderRecord&, dispatch::core::v1::OrderStatus expected) = 0;

  // PENDING -> DRIVER_ASSIGNED compare-and-set. Clears the search timer.
  virtual Result AssignDriverIfPending(Transaction&, const std::string& order_id, const std::string& driver_id, uint64_t accepted_at_ms) = 0;

  // Re-arms the search timer and bumps search_attempts while PENDING.
  virtual Result RestartSearch(Transaction&, const std::string& order_id, uint64_t next_expires_at_ms) = 0;

  // Moves an expired timer from `expected` to `next` (0 = stop searching).
  // Exactly one caller wins for a given expected value.
  virtual Result ClaimSearchExpiry(Transaction&, const std::string& order_id, uint64_t expected_expires_at_ms, uint64_t next_expires_at_ms) = 0;

  // PENDING orders whose timer is set and <= now, oldest first.
  virtual std::vector<model::OrderRecord> ListExpiredSearches(Transaction&, uint64_t now_ms, uint32_t limit) = 0;

  // Newest non-terminal order of the rider / assigned driver.
  virtual std::optional<model::OrderRecord> FindActiveOrderForRider(Transaction&, const std::string& rider_id)   = 0;
  virtual std::optional<model::OrderRecord> FindActiveOrderForDriver(Transaction&, const std::string& driver_id) = 0;

  // Orders where the id is rider or driver, newest first.
  virtual std::vector<model::OrderRecord> ListOrdersForParticipant(Transaction&, const std::string& participant_id, uint32_t offset,
                                                                   uint32_t limit)                                     = 0;
  virtual uint64_t                        CountOrdersForParticipant(Transaction&, const std::string& participant_id) = 0;

  // ---------------------------------------------------------------------
  // Drivers
  // ---------------------------------------------------------------------

  virtual Result InsertDriver(Transaction&, const model::DriverRecord&) = 0;

  virtual std::optional<model::DriverRecord> GetDriver(Transaction&, const std::string& id) = 0;

  virtual Result UpdateDriver(Transaction&, const model::DriverRecord&) = 0;

  // Online drivers with a known position inside the box (inclusive).
  virtual std::vector<model::DriverRecord> ListOnlineDriversInBox(Transaction&, double min_lat, double max_lat, double min_lng,
                                                                  double max_lng) = 0;

  virtual model::DriverOrderStats GetDriverOrderStats(Transaction&, const std::string& driver_id) = 0;

  // ---------------------------------------------------------------------
  // Declines (append-only)
  // ---------------------------------------------------------------------

  virtual Result InsertDecline(Transaction&, const model::DeclineRecord&) = 0;

  virtual std::vector<model::DeclineRecord> ListDeclines(Transaction&, const std::string& order_id) = 0;

  // ---------------------------------------------------------------------
  // Order events
  // ---------------------------------------------------------------------

  virtual Result InsertOrderEvent(Transaction&, const model::OrderEventRecord&) = 0;

  // Oldest first.
  virtual std::vector<model::OrderEventRecord> ListOrderEvents(Transaction&, const std::string& order_id) = 0;

  // ---------------------------------------------------------------------
  // Ratings
  // ---------------------------------------------------------------------

  // AlreadyExists when (order_id, from_id) was rated before.
  virtual Result InsertRating(Transaction&, const model::RatingRecord&) = 0;

  virtual std::vector<model::RatingRecord> ListRatingsFor(Transaction&, const std::string& to_id) = 0;
};

} // namespace dispatch::db
