#include "pg_schema.hpp"

#include <pqxx/pqxx>

namespace dispatch::db::postgres {

void BootstrapSchema(const std::string& conninfo) {
  pqxx::connection conn(conninfo);
  pqxx::work       tx(conn);

  tx.exec(
      "CREATE TABLE IF NOT EXISTS orders ("
      " id TEXT PRIMARY KEY, type SMALLINT NOT NULL, status SMALLINT NOT NULL,"
      " rider_id TEXT NOT NULL, driver_id TEXT NOT NULL DEFAULT '',"
      " pickup_lat DOUBLE PRECISION NOT NULL, pickup_lng DOUBLE PRECISION NOT NULL, pickup_address TEXT NOT NULL DEFAULT '',"
      " dropoff_lat DOUBLE PRECISION NOT NULL, dropoff_lng DOUBLE PRECISION NOT NULL, dropoff_address TEXT NOT NULL DEFAULT '',"
      " vehicle_class TEXT NOT NULL, distance_km DOUBLE PRECISION NOT NULL, duration_minutes INTEGER NOT NULL,"
      " estimated_fare DOUBLE PRECISION NOT NULL, final_fare DOUBLE PRECISION NOT NULL DEFAULT 0,"
      " surge_multiplier DOUBLE PRECISION NOT NULL DEFAULT 1, otp TEXT NOT NULL,"
      " recipient_name TEXT NOT NULL DEFAULT '', recipient_phone TEXT NOT NULL DEFAULT '', package_description TEXT NOT NULL DEFAULT '',"
      " requested_at_ms BIGINT NOT NULL, accepted_at_ms BIGINT NOT NULL DEFAULT 0, started_at_ms BIGINT NOT NULL DEFAULT 0,"
      " completed_at_ms BIGINT NOT NULL DEFAULT 0, cancelled_at_ms BIGINT NOT NULL DEFAULT 0,"
      " cancelled_by TEXT NOT NULL DEFAULT '', cancellation_reason TEXT NOT NULL DEFAULT '',"
      " search_attempts INTEGER NOT NULL DEFAULT 0, search_expires_at_ms BIGINT NOT NULL DEFAULT 0);");
  tx.exec("CREATE INDEX IF NOT EXISTS orders_rider_idx ON orders(rider_id, requested_at_ms);");
  tx.exec("CREATE INDEX IF NOT EXISTS orders_driver_idx ON orders(driver_id, requested_at_ms);");
  tx.exec("CREATE INDEX IF NOT EXISTS orders_search_idx ON orders(status, search_expires_at_ms);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS drivers ("
      " id TEXT PRIMARY KEY, online BOOLEAN NOT NULL DEFAULT FALSE, availability SMALLINT NOT NULL,"
      " vehicle_class TEXT NOT NULL, plate TEXT NOT NULL DEFAULT '', model TEXT NOT NULL DEFAULT '', color TEXT NOT NULL DEFAULT '',"
      " rating DOUBLE PRECISION NOT NULL DEFAULT 5, total_rides INTEGER NOT NULL DEFAULT 0, total_deliveries INTEGER NOT NULL DEFAULT 0,"
      " has_position BOOLEAN NOT NULL DEFAULT FALSE, last_lat DOUBLE PRECISION NOT NULL DEFAULT 0,"
      " last_lng DOUBLE PRECISION NOT NULL DEFAULT 0, heading DOUBLE PRECISION NOT NULL DEFAULT 0,"
      " location_updated_at_ms BIGINT NOT NULL DEFAULT 0);");
  tx.exec("CREATE INDEX IF NOT EXISTS drivers_position_idx ON drivers(online, last_lat, last_lng);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS order_declines ("
      " seq BIGSERIAL PRIMARY KEY, order_id TEXT NOT NULL REFERENCES orders(id), driver_id TEXT NOT NULL,"
      " reason TEXT NOT NULL DEFAULT '', declined_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS order_declines_order_idx ON order_declines(order_id);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS order_events ("
      " seq BIGSERIAL PRIMARY KEY, order_id TEXT NOT NULL REFERENCES orders(id), type SMALLINT NOT NULL,"
      " actor_id TEXT NOT NULL DEFAULT '', has_position BOOLEAN NOT NULL DEFAULT FALSE,"
      " lat DOUBLE PRECISION, lng DOUBLE PRECISION, at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS order_events_order_idx ON order_events(order_id, at_ms);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS ratings ("
      " order_id TEXT NOT NULL REFERENCES orders(id), from_id TEXT NOT NULL, to_id TEXT NOT NULL,"
      " stars SMALLINT NOT NULL, comment TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL,"
      " PRIMARY KEY (order_id, from_id));");
  tx.exec("CREATE INDEX IF NOT EXISTS ratings_to_idx ON ratings(to_id);");

  tx.commit();
}

} // namespace dispatch::db::postgres
