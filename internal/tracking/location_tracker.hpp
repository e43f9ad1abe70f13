#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "internal/geo/geo_math.hpp"

namespace dispatch::cluster {
class ClusterBus;
}
namespace dispatch::db {
class Repository;
}
namespace dispatch::geo {
class GeoIndex;
}
namespace dispatch::realtime {
class RealtimeGateway;
}

namespace dispatch::tracking {

struct TrackerOptions {
  double movement_threshold_m = 80.0;
};

struct LocationUpdate {
  bool                  updated = false;
  std::optional<double> distance_meters; // absent on the first report
};

/*
  LocationTracker

  Single entry point for driver positions, from RPC or the realtime
  stream. Movement below the threshold is suppressed: no write and no
  republish. The index entry is refreshed at the stored position so a
  parked driver stays dispatchable.

  An accepted position is written to the repository first. Indexing,
  the cluster republish and the push to the order channel are best
  effort and never fail the report.
*/
class LocationTracker {
 public:
  LocationTracker(std::shared_ptr<db::Repository> repository, std::shared_ptr<geo::GeoIndex> geo, std::shared_ptr<cluster::ClusterBus> bus,
                  std::shared_ptr<realtime::RealtimeGateway> gateway, TrackerOptions options, std::function<uint64_t()> clock = {});

  // Throws DRIVER_NOT_FOUND, DRIVER_OFFLINE or INVALID_INPUT.
  LocationUpdate ReportLocation(const std::string& driver_id, const geo::Coordinates& position, double heading);

 private:
  void Republish(const std::string& driver_id, const geo::Coordinates& position, double heading, uint64_t at_ms,
                 const std::optional<std::string>& active_order_id);

  std::shared_ptr<db::Repository>            repository_;
  std::shared_ptr<geo::GeoIndex>             geo_;
  std::shared_ptr<cluster::ClusterBus>       bus_;
  std::shared_ptr<realtime::RealtimeGateway> gateway_;
  TrackerOptions                             options_;
  std::function<uint64_t()>                  clock_;
};

} // namespace dispatch::tracking
