#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "geo_backend.hpp"

namespace dispatch::async {
class TaskWorker;
}
namespace dispatch::db {
class Repository;
}

namespace dispatch::geo {

struct GeoIndexOptions {
  uint32_t entry_ttl_ms      = 300'000;
  uint32_t query_timeout_ms  = 5'000;
  uint32_t upsert_timeout_ms = 3'000;
};

/*
  Live index of online drivers' last known positions.

  Primary path: a GeoBackend, every call bounded by a deadline on the
  worker pool. Fallback path: bounding-box query against the repository
  followed by an exact haversine filter and sort.

  Nothing here throws to the caller. A failed or slow upsert is logged
  and dropped; a failed, slow or empty primary query is answered from
  the fallback.
*/
class GeoIndex {
 public:
  GeoIndex(std::shared_ptr<GeoBackend> primary, std::shared_ptr<db::Repository> repository, std::shared_ptr<async::TaskWorker> worker,
           GeoIndexOptions options);

  void Upsert(const std::string& driver_id, const Coordinates& position, double heading);
  void Remove(const std::string& driver_id);

  // Drivers within radius_km, nearest first. limit 0 = no limit.
  std::vector<GeoHit> Query(const Coordinates& center, double radius_km, uint32_t limit);

  // nullopt when the driver has no known position.
  std::optional<double> DistanceTo(const std::string& driver_id, const Coordinates& point);

  bool   PrimaryHealthy() const;
  size_t IndexedCount();

 private:
  std::vector<GeoHit>        QueryFallback(const Coordinates& center, double radius_km, uint32_t limit);
  std::optional<Coordinates> StoredPosition(const std::string& driver_id);
  void                       MarkPrimary(bool healthy);

  std::shared_ptr<GeoBackend>         primary_;
  std::shared_ptr<db::Repository>     repository_;
  std::shared_ptr<async::TaskWorker>  worker_;
  GeoIndexOptions                     options_;
  std::atomic<bool>                   primary_healthy_{true};
};

} // namespace dispatch::geo
