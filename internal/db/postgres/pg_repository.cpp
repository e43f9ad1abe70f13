#include "pg_repository.hpp"

#include <limits>
#include <optional>

namespace dispatch::db::postgres {

using dispatch::core::v1::ORDER_EVENT_TYPE_DRIVER_ASSIGNED;
using dispatch::core::v1::ORDER_STATUS_CANCELLED;
using dispatch::core::v1::ORDER_STATUS_COMPLETED;
using dispatch::core::v1::ORDER_STATUS_DRIVER_ASSIGNED;
using dispatch::core::v1::ORDER_STATUS_PENDING;

namespace {

model::OrderRecord ReadOrder(const pqxx::row& row) {
  model::OrderRecord r;
  r.id                   = row[0].c_str();
  r.type                 = static_cast<dispatch::core::v1::OrderType>(row[1].as<int>());
  r.status               = static_cast<dispatch::core::v1::OrderStatus>(row[2].as<int>());
  r.rider_id             = row[3].c_str();
  r.driver_id            = row[4].c_str();
  r.pickup_lat           = row[5].as<double>();
  r.pickup_lng           = row[6].as<double>();
  r.pickup_address       = row[7].c_str();
  r.dropoff_lat          = row[8].as<double>();
  r.dropoff_lng          = row[9].as<double>();
  r.dropoff_address      = row[10].c_str();
  r.vehicle_class        = row[11].c_str();
  r.distance_km          = row[12].as<double>();
  r.duration_minutes     = row[13].as<int32_t>();
  r.estimated_fare       = row[14].as<double>();
  r.final_fare           = row[15].as<double>();
  r.surge_multiplier     = row[16].as<double>();
  r.otp                  = row[17].c_str();
  r.recipient_name       = row[18].c_str();
  r.recipient_phone      = row[19].c_str();
  r.package_description  = row[20].c_str();
  r.requested_at_ms      = row[21].as<uint64_t>();
  r.accepted_at_ms       = row[22].as<uint64_t>();
  r.started_at_ms        = row[23].as<uint64_t>();
  r.completed_at_ms      = row[24].as<uint64_t>();
  r.cancelled_at_ms      = row[25].as<uint64_t>();
  r.cancelled_by         = row[26].c_str();
  r.cancellation_reason  = row[27].c_str();
  r.search_attempts      = row[28].as<uint32_t>();
  r.search_expires_at_ms = row[29].as<uint64_t>();
  return r;
}

model::DriverRecord ReadDriver(const pqxx::row& row) {
  model::DriverRecord r;
  r.id                     = row[0].c_str();
  r.online                 = row[1].as<bool>();
  r.availability           = static_cast<dispatch::core::v1::DriverAvailability>(row[2].as<int>());
  r.vehicle_class          = row[3].c_str();
  r.plate                  = row[4].c_str();
  r.model                  = row[5].c_str();
  r.color                  = row[6].c_str();
  r.rating                 = row[7].as<double>();
  r.total_rides            = row[8].as<uint32_t>();
  r.total_deliveries       = row[9].as<uint32_t>();
  r.has_position           = row[10].as<bool>();
  r.last_lat               = row[11].as<double>();
  r.last_lng               = row[12].as<double>();
  r.heading                = row[13].as<double>();
  r.location_updated_at_ms = row[14].as<uint64_t>();
  return r;
}

std::vector<model::OrderRecord> ReadOrders(const pqxx::result& res) {
  std::vector<model::OrderRecord> out;
  out.reserve(res.size());
  for (const auto& row : res)
    out.push_back(ReadOrder(row));
  return out;
}

pqxx::result ExecOrder(pqxx::work& w, const char* stmt, const model::OrderRecord& r) {
  return w.exec_prepared(stmt, r.id, static_cast<int>(r.type), static_cast<int>(r.status), r.rider_id, r.driver_id, r.pickup_lat, r.pickup_lng,
                         r.pickup_address, r.dropoff_lat, r.dropoff_lng, r.dropoff_address, r.vehicle_class, r.distance_km, r.duration_minutes,
                         r.estimated_fare, r.final_fare, r.surge_multiplier, r.otp, r.recipient_name, r.recipient_phone, r.package_description,
                         r.requested_at_ms, r.accepted_at_ms, r.started_at_ms, r.completed_at_ms, r.cancelled_at_ms, r.cancelled_by,
                         r.cancellation_reason, r.search_attempts, r.search_expires_at_ms);
}

pqxx::result ExecDriver(pqxx::work& w, const char* stmt, const model::DriverRecord& r) {
  return w.exec_prepared(stmt, r.id, r.online, static_cast<int>(r.availability), r.vehicle_class, r.plate, r.model, r.color, r.rating, r.total_rides,
                         r.total_deliveries, r.has_position, r.last_lat, r.last_lng, r.heading, r.location_updated_at_ms);
}

int64_t LimitOrAll(uint32_t limit) {
  return limit ? static_cast<int64_t>(limit) : std::numeric_limits<int64_t>::max();
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::MissOrConflict(pqxx::work& w, const std::string& order_id) {
  auto res = w.exec_prepared("order_exists", order_id);
  if (res.empty()) return Result::Err(ErrorCode::NotFound);
  return Result::Err(ErrorCode::Conflict, "order status changed");
}

// ------------------------------------------------------------------
// Orders
// ------------------------------------------------------------------

Result PgRepository::InsertOrder(Transaction& t, const model::OrderRecord& r) {
  try {
    ExecOrder(TX(t).Work(), "insert_order", r);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::OrderRecord> PgRepository::GetOrder(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_order", id);
  if (res.empty()) return std::nullopt;
  return ReadOrder(res[0]);
}

Result PgRepository::UpdateOrderIfStatus(Transaction& t, const model::OrderRecord& r, dispatch::core::v1::OrderStatus expected) {
  try {
    auto& w   = TX(t).Work();
    auto  res = w.exec_prepared("update_order_if_status", r.id, static_cast<int>(r.type), static_cast<int>(r.status), r.rider_id, r.driver_id,
                                r.pickup_lat, r.pickup_lng, r.pickup_address, r.dropoff_lat, r.dropoff_lng, r.dropoff_address, r.vehicle_class,
                                r.distance_km, r.duration_minutes, r.estimated_fare, r.final_fare, r.surge_multiplier, r.otp, r.recipient_name,
                                r.recipient_phone, r.package_description, r.requested_at_ms, r.accepted_at_ms, r.started_at_ms,
                                r.completed_at_ms, r.cancelled_at_ms, r.cancelled_by, r.cancellation_reason, r.search_attempts,
                                r.search_expires_at_ms, static_cast<int>(expected));
    if (res.affected_rows() == 0) return MissOrConflict(w, r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::AssignDriverIfPending(Transaction& t, const std::string& order_id, const std::string& driver_id, uint64_t accepted_at_ms) {
  try {
    auto& w   = TX(t).Work();
    auto  res = w.exec_prepared("assign_driver_if_pending", static_cast<int>(ORDER_STATUS_DRIVER_ASSIGNED), driver_id, accepted_at_ms, order_id,
                                static_cast<int>(ORDER_STATUS_PENDING));
    if (res.affected_rows() == 0) return MissOrConflict(w, order_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::RestartSearch(Transaction& t, const std::string& order_id, uint64_t next_expires_at_ms) {
  try {
    auto& w   = TX(t).Work();
    auto  res = w.exec_prepared("restart_search", next_expires_at_ms, order_id, static_cast<int>(ORDER_STATUS_PENDING));
    if (res.affected_rows() == 0) return MissOrConflict(w, order_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ClaimSearchExpiry(Transaction& t, const std::string& order_id, uint64_t expected_expires_at_ms, uint64_t next_expires_at_ms) {
  try {
    auto& w = TX(t).Work();
    auto  res =
        w.exec_prepared("claim_search_expiry", next_expires_at_ms, order_id, static_cast<int>(ORDER_STATUS_PENDING), expected_expires_at_ms);
    if (res.affected_rows() == 0) return MissOrConflict(w, order_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::OrderRecord> PgRepository::ListExpiredSearches(Transaction& t, uint64_t now_ms, uint32_t limit) {
  return ReadOrders(TX(t).Work().exec_prepared("list_expired_searches", static_cast<int>(ORDER_STATUS_PENDING), now_ms, LimitOrAll(limit)));
}

std::optional<model::OrderRecord> PgRepository::FindActiveOrderForRider(Transaction& t, const std::string& rider_id) {
  auto res = TX(t).Work().exec_prepared("active_order_for_rider", rider_id, static_cast<int>(ORDER_STATUS_COMPLETED),
                                        static_cast<int>(ORDER_STATUS_CANCELLED));
  if (res.empty()) return std::nullopt;
  return ReadOrder(res[0]);
}

std::optional<model::OrderRecord> PgRepository::FindActiveOrderForDriver(Transaction& t, const std::string& driver_id) {
  auto res = TX(t).Work().exec_prepared("active_order_for_driver", driver_id, static_cast<int>(ORDER_STATUS_COMPLETED),
                                        static_cast<int>(ORDER_STATUS_CANCELLED));
  if (res.empty()) return std::nullopt;
  return ReadOrder(res[0]);
}

std::vector<model::OrderRecord> PgRepository::ListOrdersForParticipant(Transaction& t, const std::string& participant_id, uint32_t offset,
                                                                       uint32_t limit) {
  return ReadOrders(TX(t).Work().exec_prepared("orders_for_participant", participant_id, LimitOrAll(limit), static_cast<int64_t>(offset)));
}

uint64_t PgRepository::CountOrdersForParticipant(Transaction& t, const std::string& participant_id) {
  auto res = TX(t).Work().exec_prepared("count_orders_for_participant", participant_id);
  return res.empty() ? 0 : res[0][0].as<uint64_t>();
}

// ------------------------------------------------------------------
// Drivers
// ------------------------------------------------------------------

Result PgRepository::InsertDriver(Transaction& t, const model::DriverRecord& r) {
  try {
    ExecDriver(TX(t).Work(), "insert_driver", r);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DriverRecord> PgRepository::GetDriver(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_driver", id);
  if (res.empty()) return std::nullopt;
  return ReadDriver(res[0]);
}

Result PgRepository::UpdateDriver(Transaction& t, const model::DriverRecord& r) {
  try {
    auto res = ExecDriver(TX(t).Work(), "update_driver", r);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::DriverRecord> PgRepository::ListOnlineDriversInBox(Transaction& t, double min_lat, double max_lat, double min_lng,
                                                                      double max_lng) {
  auto res = TX(t).Work().exec_prepared("online_drivers_in_box", min_lat, max_lat, min_lng, max_lng);

  std::vector<model::DriverRecord> out;
  out.reserve(res.size());
  for (const auto& row : res)
    out.push_back(ReadDriver(row));
  return out;
}

model::DriverOrderStats PgRepository::GetDriverOrderStats(Transaction& t, const std::string& driver_id) {
  auto& w = TX(t).Work();

  model::DriverOrderStats stats;
  auto assigned = w.exec_prepared("driver_assigned_count", static_cast<int>(ORDER_EVENT_TYPE_DRIVER_ASSIGNED), driver_id);
  if (!assigned.empty()) stats.assigned = assigned[0][0].as<uint64_t>();

  auto completed = w.exec_prepared("driver_completed_totals", driver_id, static_cast<int>(ORDER_STATUS_COMPLETED));
  if (!completed.empty()) {
    stats.completed = completed[0][0].as<uint64_t>();
    stats.earnings  = completed[0][1].as<double>();
  }
  return stats;
}

// ------------------------------------------------------------------
// Declines / events / ratings
// ------------------------------------------------------------------

Result PgRepository::InsertDecline(Transaction& t, const model::DeclineRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_decline", r.order_id, r.driver_id, r.reason, r.declined_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::DeclineRecord> PgRepository::ListDeclines(Transaction& t, const std::string& order_id) {
  auto res = TX(t).Work().exec_prepared("list_declines", order_id);

  std::vector<model::DeclineRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::DeclineRecord r;
    r.order_id       = row[0].c_str();
    r.driver_id      = row[1].c_str();
    r.reason         = row[2].c_str();
    r.declined_at_ms = row[3].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::InsertOrderEvent(Transaction& t, const model::OrderEventRecord& r) {
  try {
    std::optional<double> lat;
    std::optional<double> lng;
    if (r.has_position) {
      lat = r.lat;
      lng = r.lng;
    }
    TX(t).Work().exec_prepared("insert_order_event", r.order_id, static_cast<int>(r.type), r.actor_id, r.has_position, lat, lng, r.at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::OrderEventRecord> PgRepository::ListOrderEvents(Transaction& t, const std::string& order_id) {
  auto res = TX(t).Work().exec_prepared("list_order_events", order_id);

  std::vector<model::OrderEventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::OrderEventRecord r;
    r.order_id     = row[0].c_str();
    r.type         = static_cast<dispatch::core::v1::OrderEventType>(row[1].as<int>());
    r.actor_id     = row[2].c_str();
    r.has_position = row[3].as<bool>();
    r.lat          = row[4].as<double>();
    r.lng          = row[5].as<double>();
    r.at_ms        = row[6].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::InsertRating(Transaction& t, const model::RatingRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_rating", r.order_id, r.from_id, r.to_id, r.stars, r.comment, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RatingRecord> PgRepository::ListRatingsFor(Transaction& t, const std::string& to_id) {
  auto res = TX(t).Work().exec_prepared("list_ratings_for", to_id);

  std::vector<model::RatingRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::RatingRecord r;
    r.order_id      = row[0].c_str();
    r.from_id       = row[1].c_str();
    r.to_id         = row[2].c_str();
    r.stars         = row[3].as<int32_t>();
    r.comment       = row[4].c_str();
    r.created_at_ms = row[5].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace dispatch::db::postgres
