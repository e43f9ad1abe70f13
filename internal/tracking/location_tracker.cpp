#include "location_tracker.hpp"

#include "dispatch/cluster/v1/relay.pb.h"
#include "internal/cluster/cluster_bus.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/api/tx_helpers.hpp"
#include "internal/geo/geo_index.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/realtime/realtime_gateway.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace dispatch::tracking {

using dispatch::observability::DoubleField;
using dispatch::observability::StringField;

LocationTracker::LocationTracker(std::shared_ptr<db::Repository> repository, std::shared_ptr<geo::GeoIndex> geo,
                                 std::shared_ptr<cluster::ClusterBus> bus, std::shared_ptr<realtime::RealtimeGateway> gateway,
                                 TrackerOptions options, std::function<uint64_t()> clock)
    : repository_(std::move(repository)),
      geo_(std::move(geo)),
      bus_(std::move(bus)),
      gateway_(std::move(gateway)),
      options_(options),
      clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return util::NowMillis(); };
  }
}

LocationUpdate LocationTracker::ReportLocation(const std::string& driver_id, const geo::Coordinates& position, double heading) {
  if (!geo::IsValidCoordinate(position)) {
    throw util::InvalidInput("reported position is not a valid coordinate");
  }

  struct Outcome {
    LocationUpdate             update;
    std::optional<std::string> active_order_id;
    uint64_t                   at_ms = 0;
    // Stored position re-indexed for a suppressed report.
    std::optional<geo::Coordinates> held_position;
    double                          held_heading = 0;
  };

  const auto outcome = db::WithRetry("report location", [&] {
    auto tx     = repository_->Begin();
    auto driver = repository_->GetDriver(*tx, driver_id);
    if (!driver) {
      throw util::DriverNotFound(driver_id);
    }
    if (!driver->online) {
      throw util::DriverOffline("driver " + driver_id + " is offline; go online before reporting a location");
    }

    Outcome out;
    if (driver->has_position) {
      const double moved_m       = geo::HaversineKm({driver->last_lat, driver->last_lng}, position) * 1000.0;
      out.update.distance_meters = geo::RoundTo(moved_m, 1);
      if (moved_m < options_.movement_threshold_m) {
        out.held_position = geo::Coordinates{driver->last_lat, driver->last_lng};
        out.held_heading  = driver->heading;
        return out;
      }
    }

    out.at_ms                      = clock_();
    driver->has_position           = true;
    driver->last_lat               = position.latitude;
    driver->last_lng               = position.longitude;
    driver->heading                = heading;
    driver->location_updated_at_ms = out.at_ms;
    db::ThrowIfError(repository_->UpdateDriver(*tx, *driver), "update driver position");

    if (auto active = repository_->FindActiveOrderForDriver(*tx, driver_id)) {
      out.active_order_id = active->id;
    }
    tx->Commit();

    out.update.updated = true;
    return out;
  });

  if (!outcome.update.updated) {
    observability::Metrics::Instance().RecordDispatchEvent("location_suppressed");
    // Keeps a parked driver's index entry from expiring.
    if (outcome.held_position) {
      geo_->Upsert(driver_id, *outcome.held_position, outcome.held_heading);
    }
    return outcome.update;
  }

  Republish(driver_id, position, heading, outcome.at_ms, outcome.active_order_id);
  return outcome.update;
}

void LocationTracker::Republish(const std::string& driver_id, const geo::Coordinates& position, double heading, uint64_t at_ms,
                                const std::optional<std::string>& active_order_id) {
  geo_->Upsert(driver_id, position, heading);

  dispatch::cluster::v1::DriverLocation location;
  location.set_driver_id(driver_id);
  location.set_latitude(position.latitude);
  location.set_longitude(position.longitude);
  location.set_heading(heading);
  location.set_timestamp_ms(static_cast<int64_t>(at_ms));
  bus_->Publish(cluster::kDriverLocationTopic, location.SerializeAsString());

  if (!active_order_id) {
    return;
  }

  try {
    dispatch::realtime::v1::ServerMessage message;
    auto*                                 update = message.mutable_driver_location();
    update->set_driver_id(driver_id);
    update->set_latitude(position.latitude);
    update->set_longitude(position.longitude);
    update->set_heading(heading);
    update->set_order_id(*active_order_id);
    gateway_->Broadcast(realtime::OrderChannel(*active_order_id), std::move(message));
  } catch (const std::exception& e) {
    DISPATCH_LOG_WARN("order channel push failed", {StringField("order_id", *active_order_id), StringField("driver_id", driver_id),
                                                    DoubleField("latitude", position.latitude), StringField("error", e.what())});
  }
}

} // namespace dispatch::tracking
