#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace dispatch::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS orders ("
      " id TEXT PRIMARY KEY, type INTEGER NOT NULL, status INTEGER NOT NULL,"
      " rider_id TEXT NOT NULL, driver_id TEXT NOT NULL DEFAULT '',"
      " pickup_lat REAL NOT NULL, pickup_lng REAL NOT NULL, pickup_address TEXT NOT NULL DEFAULT '',"
      " dropoff_lat REAL NOT NULL, dropoff_lng REAL NOT NULL, dropoff_address TEXT NOT NULL DEFAULT '',"
      " vehicle_class TEXT NOT NULL, distance_km REAL NOT NULL, duration_minutes INTEGER NOT NULL,"
      " estimated_fare REAL NOT NULL, final_fare REAL NOT NULL DEFAULT 0, surge_multiplier REAL NOT NULL DEFAULT 1,"
      " otp TEXT NOT NULL,"
      " recipient_name TEXT NOT NULL DEFAULT '', recipient_phone TEXT NOT NULL DEFAULT '', package_description TEXT NOT NULL DEFAULT '',"
      " requested_at_ms INTEGER NOT NULL, accepted_at_ms INTEGER NOT NULL DEFAULT 0, started_at_ms INTEGER NOT NULL DEFAULT 0,"
      " completed_at_ms INTEGER NOT NULL DEFAULT 0, cancelled_at_ms INTEGER NOT NULL DEFAULT 0,"
      " cancelled_by TEXT NOT NULL DEFAULT '', cancellation_reason TEXT NOT NULL DEFAULT '',"
      " search_attempts INTEGER NOT NULL DEFAULT 0, search_expires_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS orders_rider_idx ON orders(rider_id, requested_at_ms);",
      "CREATE INDEX IF NOT EXISTS orders_driver_idx ON orders(driver_id, requested_at_ms);",
      "CREATE INDEX IF NOT EXISTS orders_search_idx ON orders(status, search_expires_at_ms);",
      "CREATE TABLE IF NOT EXISTS drivers ("
      " id TEXT PRIMARY KEY, online INTEGER NOT NULL DEFAULT 0, availability INTEGER NOT NULL,"
      " vehicle_class TEXT NOT NULL, plate TEXT NOT NULL DEFAULT '', model TEXT NOT NULL DEFAULT '', color TEXT NOT NULL DEFAULT '',"
      " rating REAL NOT NULL DEFAULT 5, total_rides INTEGER NOT NULL DEFAULT 0, total_deliveries INTEGER NOT NULL DEFAULT 0,"
      " has_position INTEGER NOT NULL DEFAULT 0, last_lat REAL NOT NULL DEFAULT 0, last_lng REAL NOT NULL DEFAULT 0,"
      " heading REAL NOT NULL DEFAULT 0, location_updated_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS drivers_position_idx ON drivers(online, last_lat, last_lng);",
      "CREATE TABLE IF NOT EXISTS order_declines ("
      " order_id TEXT NOT NULL REFERENCES orders(id), driver_id TEXT NOT NULL, reason TEXT NOT NULL DEFAULT '',"
      " declined_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS order_declines_order_idx ON order_declines(order_id);",
      "CREATE TABLE IF NOT EXISTS order_events ("
      " seq INTEGER PRIMARY KEY AUTOINCREMENT, order_id TEXT NOT NULL REFERENCES orders(id), type INTEGER NOT NULL,"
      " actor_id TEXT NOT NULL DEFAULT '', has_position INTEGER NOT NULL DEFAULT 0, lat REAL, lng REAL, at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS order_events_order_idx ON order_events(order_id, at_ms);",
      "CREATE TABLE IF NOT EXISTS ratings ("
      " order_id TEXT NOT NULL REFERENCES orders(id), from_id TEXT NOT NULL, to_id TEXT NOT NULL,"
      " stars INTEGER NOT NULL, comment TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL,"
      " PRIMARY KEY (order_id, from_id));",
      "CREATE INDEX IF NOT EXISTS ratings_to_idx ON ratings(to_id);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

} // namespace dispatch::db::sqlite
