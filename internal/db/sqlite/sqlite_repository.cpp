#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace dispatch::db::sqlite {

using dispatch::db::ErrorCode;
using dispatch::db::Result;
using dispatch::core::v1::ORDER_EVENT_TYPE_DRIVER_ASSIGNED;
using dispatch::core::v1::ORDER_STATUS_CANCELLED;
using dispatch::core::v1::ORDER_STATUS_COMPLETED;
using dispatch::core::v1::ORDER_STATUS_DRIVER_ASSIGNED;
using dispatch::core::v1::ORDER_STATUS_PENDING;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return StmtPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

constexpr const char* kOrderColumns =
    "id,type,status,rider_id,driver_id,pickup_lat,pickup_lng,pickup_address,dropoff_lat,dropoff_lng,dropoff_address,"
    "vehicle_class,distance_km,duration_minutes,estimated_fare,final_fare,surge_multiplier,otp,"
    "recipient_name,recipient_phone,package_description,requested_at_ms,accepted_at_ms,started_at_ms,completed_at_ms,"
    "cancelled_at_ms,cancelled_by,cancellation_reason,search_attempts,search_expires_at_ms";

constexpr const char* kDriverColumns =
    "id,online,availability,vehicle_class,plate,model,color,rating,total_rides,total_deliveries,"
    "has_position,last_lat,last_lng,heading,location_updated_at_ms";

// binds parameters ?1..?30 in kOrderColumns order
void BindOrder(sqlite3_stmt* st, const model::OrderRecord& r) {
  BindText(st, 1, r.id);
  BindI32(st, 2, static_cast<int>(r.type));
  BindI32(st, 3, static_cast<int>(r.status));
  BindText(st, 4, r.rider_id);
  BindText(st, 5, r.driver_id);
  BindDouble(st, 6, r.pickup_lat);
  BindDouble(st, 7, r.pickup_lng);
  BindText(st, 8, r.pickup_address);
  BindDouble(st, 9, r.dropoff_lat);
  BindDouble(st, 10, r.dropoff_lng);
  BindText(st, 11, r.dropoff_address);
  BindText(st, 12, r.vehicle_class);
  BindDouble(st, 13, r.distance_km);
  BindI32(st, 14, r.duration_minutes);
  BindDouble(st, 15, r.estimated_fare);
  BindDouble(st, 16, r.final_fare);
  BindDouble(st, 17, r.surge_multiplier);
  BindText(st, 18, r.otp);
  BindText(st, 19, r.recipient_name);
  BindText(st, 20, r.recipient_phone);
  BindText(st, 21, r.package_description);
  BindU64(st, 22, r.requested_at_ms);
  BindU64(st, 23, r.accepted_at_ms);
  BindU64(st, 24, r.started_at_ms);
  BindU64(st, 25, r.completed_at_ms);
  BindU64(st, 26, r.cancelled_at_ms);
  BindText(st, 27, r.cancelled_by);
  BindText(st, 28, r.cancellation_reason);
  BindU64(st, 29, r.search_attempts);
  BindU64(st, 30, r.search_expires_at_ms);
}

model::OrderRecord ReadOrder(sqlite3_stmt* st) {
  model::OrderRecord r;
  r.id                   = ColText(st, 0);
  r.type                 = static_cast<dispatch::core::v1::OrderType>(ColI32(st, 1));
  r.status               = static_cast<dispatch::core::v1::OrderStatus>(ColI32(st, 2));
  r.rider_id             = ColText(st, 3);
  r.driver_id            = ColText(st, 4);
  r.pickup_lat           = ColDouble(st, 5);
  r.pickup_lng           = ColDouble(st, 6);
  r.pickup_address       = ColText(st, 7);
  r.dropoff_lat          = ColDouble(st, 8);
  r.dropoff_lng          = ColDouble(st, 9);
  r.dropoff_address      = ColText(st, 10);
  r.vehicle_class        = ColText(st, 11);
  r.distance_km          = ColDouble(st, 12);
  r.duration_minutes     = ColI32(st, 13);
  r.estimated_fare       = ColDouble(st, 14);
  r.final_fare           = ColDouble(st, 15);
  r.surge_multiplier     = ColDouble(st, 16);
  r.otp                  = ColText(st, 17);
  r.recipient_name       = ColText(st, 18);
  r.recipient_phone      = ColText(st, 19);
  r.package_description  = ColText(st, 20);
  r.requested_at_ms      = ColU64(st, 21);
  r.accepted_at_ms       = ColU64(st, 22);
  r.started_at_ms        = ColU64(st, 23);
  r.completed_at_ms      = ColU64(st, 24);
  r.cancelled_at_ms      = ColU64(st, 25);
  r.cancelled_by         = ColText(st, 26);
  r.cancellation_reason  = ColText(st, 27);
  r.search_attempts      = static_cast<uint32_t>(ColU64(st, 28));
  r.search_expires_at_ms = ColU64(st, 29);
  return r;
}

void BindDriver(sqlite3_stmt* st, const model::DriverRecord& r) {
  BindText(st, 1, r.id);
  BindI32(st, 2, r.online ? 1 : 0);
  BindI32(st, 3, static_cast<int>(r.availability));
  BindText(st, 4, r.vehicle_class);
  BindText(st, 5, r.plate);
  BindText(st, 6, r.model);
  BindText(st, 7, r.color);
  BindDouble(st, 8, r.rating);
  BindU64(st, 9, r.total_rides);
  BindU64(st, 10, r.total_deliveries);
  BindI32(st, 11, r.has_position ? 1 : 0);
  BindDouble(st, 12, r.last_lat);
  BindDouble(st, 13, r.last_lng);
  BindDouble(st, 14, r.heading);
  BindU64(st, 15, r.location_updated_at_ms);
}

model::DriverRecord ReadDriver(sqlite3_stmt* st) {
  model::DriverRecord r;
  r.id                     = ColText(st, 0);
  r.online                 = ColI32(st, 1) != 0;
  r.availability           = static_cast<dispatch::core::v1::DriverAvailability>(ColI32(st, 2));
  r.vehicle_class          = ColText(st, 3);
  r.plate                  = ColText(st, 4);
  r.model                  = ColText(st, 5);
  r.color                  = ColText(st, 6);
  r.rating                 = ColDouble(st, 7);
  r.total_rides            = static_cast<uint32_t>(ColU64(st, 8));
  r.total_deliveries       = static_cast<uint32_t>(ColU64(st, 9));
  r.has_position           = ColI32(st, 10) != 0;
  r.last_lat               = ColDouble(st, 11);
  r.last_lng               = ColDouble(st, 12);
  r.heading                = ColDouble(st, 13);
  r.location_updated_at_ms = ColU64(st, 14);
  return r;
}

std::vector<model::OrderRecord> ReadOrders(sqlite3_stmt* st) {
  std::vector<model::OrderRecord> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(ReadOrder(st));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteRepository::MissOrConflict(sqlite3* db, const std::string& order_id) {
  auto st = Prepare(db, "SELECT 1 FROM orders WHERE id=?;");
  BindText(st.get(), 1, order_id);
  if (sqlite3_step(st.get()) == SQLITE_ROW) return Result::Err(ErrorCode::Conflict, "order status changed");
  return Result::Err(ErrorCode::NotFound);
}

// ------------------------------------------------------------------
// Orders
// ------------------------------------------------------------------

Result SqliteRepository::InsertOrder(Transaction& t, const model::OrderRecord& r) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("INSERT INTO orders(") + kOrderColumns +
             ") VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11,?12,?13,?14,?15,?16,?17,?18,?19,?20,"
             "?21,?22,?23,?24,?25,?26,?27,?28,?29,?30);";
  auto st = Prepare(db, sql.c_str());
  BindOrder(st.get(), r);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::OrderRecord> SqliteRepository::GetOrder(Transaction& t, const std::string& id) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kOrderColumns + " FROM orders WHERE id=?;";
  auto  st  = Prepare(db, sql.c_str());
  BindText(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadOrder(st.get());
}

Result SqliteRepository::UpdateOrderIfStatus(Transaction& t, const model::OrderRecord& r, dispatch::core::v1::OrderStatus expected) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE orders SET type=?2,status=?3,rider_id=?4,driver_id=?5,pickup_lat=?6,pickup_lng=?7,pickup_address=?8,"
                     "dropoff_lat=?9,dropoff_lng=?10,dropoff_address=?11,vehicle_class=?12,distance_km=?13,duration_minutes=?14,"
                     "estimated_fare=?15,final_fare=?16,surge_multiplier=?17,otp=?18,recipient_name=?19,recipient_phone=?20,"
                     "package_description=?21,requested_at_ms=?22,accepted_at_ms=?23,started_at_ms=?24,completed_at_ms=?25,"
                     "cancelled_at_ms=?26,cancelled_by=?27,cancellation_reason=?28,search_attempts=?29,search_expires_at_ms=?30 "
                     "WHERE id=?1 AND status=?31;");
  BindOrder(st.get(), r);
  BindI32(st.get(), 31, static_cast<int>(expected));

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return MissOrConflict(db, r.id);
  return Result::Ok();
}

Result SqliteRepository::AssignDriverIfPending(Transaction& t, const std::string& order_id, const std::string& driver_id,
                                               uint64_t accepted_at_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE orders SET status=?1, driver_id=?2, accepted_at_ms=?3, search_expires_at_ms=0 "
                     "WHERE id=?4 AND status=?5;");
  BindI32(st.get(), 1, ORDER_STATUS_DRIVER_ASSIGNED);
  BindText(st.get(), 2, driver_id);
  BindU64(st.get(), 3, accepted_at_ms);
  BindText(st.get(), 4, order_id);
  BindI32(st.get(), 5, ORDER_STATUS_PENDING);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return MissOrConflict(db, order_id);
  return Result::Ok();
}

Result SqliteRepository::RestartSearch(Transaction& t, const std::string& order_id, uint64_t next_expires_at_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE orders SET search_expires_at_ms=?1, search_attempts=search_attempts+1 "
                     "WHERE id=?2 AND status=?3;");
  BindU64(st.get(), 1, next_expires_at_ms);
  BindText(st.get(), 2, order_id);
  BindI32(st.get(), 3, ORDER_STATUS_PENDING);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return MissOrConflict(db, order_id);
  return Result::Ok();
}

Result SqliteRepository::ClaimSearchExpiry(Transaction& t, const std::string& order_id, uint64_t expected_expires_at_ms,
                                           uint64_t next_expires_at_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE orders SET search_expires_at_ms=?1, "
                     "search_attempts=search_attempts + (CASE WHEN ?1 = 0 THEN 0 ELSE 1 END) "
                     "WHERE id=?2 AND status=?3 AND search_expires_at_ms=?4;");
  BindU64(st.get(), 1, next_expires_at_ms);
  BindText(st.get(), 2, order_id);
  BindI32(st.get(), 3, ORDER_STATUS_PENDING);
  BindU64(st.get(), 4, expected_expires_at_ms);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return MissOrConflict(db, order_id);
  return Result::Ok();
}

std::vector<model::OrderRecord> SqliteRepository::ListExpiredSearches(Transaction& t, uint64_t now_ms, uint32_t limit) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kOrderColumns +
             " FROM orders WHERE status=?1 AND search_expires_at_ms>0 AND search_expires_at_ms<=?2"
             " ORDER BY search_expires_at_ms, id LIMIT ?3;";
  auto st = Prepare(db, sql.c_str());
  BindI32(st.get(), 1, ORDER_STATUS_PENDING);
  BindU64(st.get(), 2, now_ms);
  sqlite3_bind_int64(st.get(), 3, limit ? static_cast<sqlite3_int64>(limit) : -1);
  return ReadOrders(st.get());
}

std::optional<model::OrderRecord> SqliteRepository::FindActiveOrderForRider(Transaction& t, const std::string& rider_id) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kOrderColumns +
             " FROM orders WHERE rider_id=?1 AND status NOT IN (?2,?3) ORDER BY requested_at_ms DESC, id DESC LIMIT 1;";
  auto st = Prepare(db, sql.c_str());
  BindText(st.get(), 1, rider_id);
  BindI32(st.get(), 2, ORDER_STATUS_COMPLETED);
  BindI32(st.get(), 3, ORDER_STATUS_CANCELLED);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadOrder(st.get());
}

std::optional<model::OrderRecord> SqliteRepository::FindActiveOrderForDriver(Transaction& t, const std::string& driver_id) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kOrderColumns +
             " FROM orders WHERE driver_id=?1 AND status NOT IN (?2,?3) ORDER BY requested_at_ms DESC, id DESC LIMIT 1;";
  auto st = Prepare(db, sql.c_str());
  BindText(st.get(), 1, driver_id);
  BindI32(st.get(), 2, ORDER_STATUS_COMPLETED);
  BindI32(st.get(), 3, ORDER_STATUS_CANCELLED);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadOrder(st.get());
}

std::vector<model::OrderRecord> SqliteRepository::ListOrdersForParticipant(Transaction& t, const std::string& participant_id, uint32_t offset,
                                                                           uint32_t limit) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kOrderColumns +
             " FROM orders WHERE rider_id=?1 OR driver_id=?1 ORDER BY requested_at_ms DESC, id DESC LIMIT ?2 OFFSET ?3;";
  auto st = Prepare(db, sql.c_str());
  BindText(st.get(), 1, participant_id);
  sqlite3_bind_int64(st.get(), 2, limit ? static_cast<sqlite3_int64>(limit) : -1);
  BindU64(st.get(), 3, offset);
  return ReadOrders(st.get());
}

uint64_t SqliteRepository::CountOrdersForParticipant(Transaction& t, const std::string& participant_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT COUNT(*) FROM orders WHERE rider_id=?1 OR driver_id=?1;");
  BindText(st.get(), 1, participant_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
  return ColU64(st.get(), 0);
}

// ------------------------------------------------------------------
// Drivers
// ------------------------------------------------------------------

Result SqliteRepository::InsertDriver(Transaction& t, const model::DriverRecord& r) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("INSERT INTO drivers(") + kDriverColumns + ") VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11,?12,?13,?14,?15);";
  auto  st  = Prepare(db, sql.c_str());
  BindDriver(st.get(), r);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::DriverRecord> SqliteRepository::GetDriver(Transaction& t, const std::string& id) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kDriverColumns + " FROM drivers WHERE id=?;";
  auto  st  = Prepare(db, sql.c_str());
  BindText(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadDriver(st.get());
}

Result SqliteRepository::UpdateDriver(Transaction& t, const model::DriverRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE drivers SET online=?2,availability=?3,vehicle_class=?4,plate=?5,model=?6,color=?7,rating=?8,"
                     "total_rides=?9,total_deliveries=?10,has_position=?11,last_lat=?12,last_lng=?13,heading=?14,"
                     "location_updated_at_ms=?15 WHERE id=?1;");
  BindDriver(st.get(), r);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::vector<model::DriverRecord> SqliteRepository::ListOnlineDriversInBox(Transaction& t, double min_lat, double max_lat, double min_lng,
                                                                          double max_lng) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kDriverColumns +
             " FROM drivers WHERE online=1 AND has_position=1"
             " AND last_lat BETWEEN ?1 AND ?2 AND last_lng BETWEEN ?3 AND ?4;";
  auto st = Prepare(db, sql.c_str());
  BindDouble(st.get(), 1, min_lat);
  BindDouble(st.get(), 2, max_lat);
  BindDouble(st.get(), 3, min_lng);
  BindDouble(st.get(), 4, max_lng);

  std::vector<model::DriverRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadDriver(st.get()));
  }
  return out;
}

model::DriverOrderStats SqliteRepository::GetDriverOrderStats(Transaction& t, const std::string& driver_id) {
  auto*                   db = TX(t).Handle();
  model::DriverOrderStats stats;

  auto assigned = Prepare(db, "SELECT COUNT(*) FROM order_events WHERE type=?1 AND actor_id=?2;");
  BindI32(assigned.get(), 1, ORDER_EVENT_TYPE_DRIVER_ASSIGNED);
  BindText(assigned.get(), 2, driver_id);
  if (sqlite3_step(assigned.get()) == SQLITE_ROW) stats.assigned = ColU64(assigned.get(), 0);

  auto completed = Prepare(db, "SELECT COUNT(*), COALESCE(SUM(final_fare),0) FROM orders WHERE driver_id=?1 AND status=?2;");
  BindText(completed.get(), 1, driver_id);
  BindI32(completed.get(), 2, ORDER_STATUS_COMPLETED);
  if (sqlite3_step(completed.get()) == SQLITE_ROW) {
    stats.completed = ColU64(completed.get(), 0);
    stats.earnings  = ColDouble(completed.get(), 1);
  }
  return stats;
}

// ------------------------------------------------------------------
// Declines / events / ratings
// ------------------------------------------------------------------

Result SqliteRepository::InsertDecline(Transaction& t, const model::DeclineRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO order_declines(order_id,driver_id,reason,declined_at_ms) VALUES(?,?,?,?);");
  BindText(st.get(), 1, r.order_id);
  BindText(st.get(), 2, r.driver_id);
  BindText(st.get(), 3, r.reason);
  BindU64(st.get(), 4, r.declined_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::DeclineRecord> SqliteRepository::ListDeclines(Transaction& t, const std::string& order_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT order_id,driver_id,reason,declined_at_ms FROM order_declines WHERE order_id=? ORDER BY rowid;");
  BindText(st.get(), 1, order_id);

  std::vector<model::DeclineRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::DeclineRecord r;
    r.order_id       = ColText(st.get(), 0);
    r.driver_id      = ColText(st.get(), 1);
    r.reason         = ColText(st.get(), 2);
    r.declined_at_ms = ColU64(st.get(), 3);
    out.push_back(std::move(r));
  }
  return out;
}

Result SqliteRepository::InsertOrderEvent(Transaction& t, const model::OrderEventRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO order_events(order_id,type,actor_id,has_position,lat,lng,at_ms) VALUES(?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.order_id);
  BindI32(st.get(), 2, static_cast<int>(r.type));
  BindText(st.get(), 3, r.actor_id);
  BindI32(st.get(), 4, r.has_position ? 1 : 0);
  if (r.has_position) {
    BindDouble(st.get(), 5, r.lat);
    BindDouble(st.get(), 6, r.lng);
  } else {
    sqlite3_bind_null(st.get(), 5);
    sqlite3_bind_null(st.get(), 6);
  }
  BindU64(st.get(), 7, r.at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::OrderEventRecord> SqliteRepository::ListOrderEvents(Transaction& t, const std::string& order_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT order_id,type,actor_id,has_position,lat,lng,at_ms FROM order_events WHERE order_id=? ORDER BY at_ms, seq;");
  BindText(st.get(), 1, order_id);

  std::vector<model::OrderEventRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::OrderEventRecord r;
    r.order_id     = ColText(st.get(), 0);
    r.type         = static_cast<dispatch::core::v1::OrderEventType>(ColI32(st.get(), 1));
    r.actor_id     = ColText(st.get(), 2);
    r.has_position = ColI32(st.get(), 3) != 0;
    r.lat          = ColDouble(st.get(), 4);
    r.lng          = ColDouble(st.get(), 5);
    r.at_ms        = ColU64(st.get(), 6);
    out.push_back(std::move(r));
  }
  return out;
}

Result SqliteRepository::InsertRating(Transaction& t, const model::RatingRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO ratings(order_id,from_id,to_id,stars,comment,created_at_ms) VALUES(?,?,?,?,?,?);");
  BindText(st.get(), 1, r.order_id);
  BindText(st.get(), 2, r.from_id);
  BindText(st.get(), 3, r.to_id);
  BindI32(st.get(), 4, r.stars);
  BindText(st.get(), 5, r.comment);
  BindU64(st.get(), 6, r.created_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::RatingRecord> SqliteRepository::ListRatingsFor(Transaction& t, const std::string& to_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT order_id,from_id,to_id,stars,comment,created_at_ms FROM ratings WHERE to_id=? ORDER BY created_at_ms;");
  BindText(st.get(), 1, to_id);

  std::vector<model::RatingRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::RatingRecord r;
    r.order_id      = ColText(st.get(), 0);
    r.from_id       = ColText(st.get(), 1);
    r.to_id         = ColText(st.get(), 2);
    r.stars         = ColI32(st.get(), 3);
    r.comment       = ColText(st.get(), 4);
    r.created_at_ms = ColU64(st.get(), 5);
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace dispatch::db::sqlite
