#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "dispatch/cluster/v1/relay.pb.h"
#include "internal/async/task_worker.hpp"
#include "internal/cluster/local_cluster_bus.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/geo/geo_index.hpp"
#include "internal/geo/memory_geo_backend.hpp"
#include "internal/realtime/realtime_gateway.hpp"
#include "internal/tracking/location_tracker.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace dispatch;
using namespace dispatch::core::v1;
using dispatch::realtime::v1::ServerMessage;

class CapturingConnection final : public realtime::Connection {
 public:
  bool Send(const ServerMessage& message) override {
    std::lock_guard lock(mutex_);
    received_.push_back(message);
    return true;
  }

  void Close() override {
  }

  std::vector<ServerMessage> Locations() {
    std::lock_guard            lock(mutex_);
    std::vector<ServerMessage> out;
    for (const auto& m : received_) {
      if (m.has_driver_location()) out.push_back(m);
    }
    return out;
  }

 private:
  std::mutex                 mutex_;
  std::vector<ServerMessage> received_;
};

struct Fixture {
  explicit Fixture(uint32_t entry_ttl_ms = 300'000) {
    worker->Start();
    geo::GeoIndexOptions geo_options;
    geo_options.entry_ttl_ms = entry_ttl_ms;
    geo                      = std::make_shared<geo::GeoIndex>(backend, repo, worker, geo_options);
    gateway = std::make_shared<realtime::RealtimeGateway>(realtime::GatewayOptions{"node-a"}, bus, geo);
    gateway->Start();
    tracker = std::make_shared<tracking::LocationTracker>(repo, geo, bus, gateway, tracking::TrackerOptions{}, [this] { return now.load(); });

    bus->Subscribe(cluster::kDriverLocationTopic, [this](const std::string& payload) {
      dispatch::cluster::v1::DriverLocation location;
      const bool                            parsed = location.ParseFromString(payload);
      assert(parsed);
      std::lock_guard lock(mutex);
      published.push_back(location);
    });
  }

  ~Fixture() {
    worker->Stop();
  }

  void AddDriver(const std::string& id, bool online) {
    db::model::DriverRecord driver;
    driver.id            = id;
    driver.online        = online;
    driver.vehicle_class = "CAR";

    auto       tx       = repo->Begin();
    const auto inserted = repo->InsertDriver(*tx, driver);
    assert(inserted);
    tx->Commit();
  }

  db::model::DriverRecord Driver(const std::string& id) {
    auto tx     = repo->Begin();
    auto driver = repo->GetDriver(*tx, id);
    assert(driver.has_value());
    return *driver;
  }

  size_t Published() {
    std::lock_guard lock(mutex);
    return published.size();
  }

  std::shared_ptr<db::memory::MemoryRepository> repo   = std::make_shared<db::memory::MemoryRepository>();
  std::shared_ptr<async::TaskWorker>            worker = std::make_shared<async::TaskWorker>("tracker-test", 2);
  std::shared_ptr<geo::MemoryGeoBackend>        backend = std::make_shared<geo::MemoryGeoBackend>();
  std::shared_ptr<cluster::LocalClusterBus>     bus    = std::make_shared<cluster::LocalClusterBus>();
  std::shared_ptr<geo::GeoIndex>                geo;
  std::shared_ptr<realtime::RealtimeGateway>    gateway;
  std::shared_ptr<tracking::LocationTracker>    tracker;
  std::atomic<uint64_t>                         now{7'000'000};

  std::mutex                                       mutex;
  std::vector<dispatch::cluster::v1::DriverLocation> published;
};

template <typename E>
void ExpectRejected(Fixture& f, const std::string& driver_id, const geo::Coordinates& position, const std::string& code) {
  bool threw = false;
  try {
    f.tracker->ReportLocation(driver_id, position, 0);
  } catch (const E& e) {
    threw = true;
    assert(e.code() == code);
  }
  assert(threw);
}

void TestFirstReportIsStoredIndexedAndPublished() {
  Fixture f;
  f.AddDriver("drv-1", true);

  const auto result = f.tracker->ReportLocation("drv-1", {28.6139, 77.2090}, 45);
  assert(result.updated);
  assert(!result.distance_meters.has_value());

  const auto driver = f.Driver("drv-1");
  assert(driver.has_position);
  assert(driver.last_lat == 28.6139);
  assert(driver.heading == 45);
  assert(driver.location_updated_at_ms == 7'000'000);

  const auto hits = f.geo->Query({28.6139, 77.2090}, 1.0, 0);
  assert(hits.size() == 1);
  assert(hits[0].driver_id == "drv-1");

  assert(f.Published() == 1);
  assert(f.published[0].driver_id() == "drv-1");
  assert(f.published[0].timestamp_ms() == 7'000'000);
}

void TestSmallMovementIsSuppressed() {
  Fixture f;
  f.AddDriver("drv-1", true);
  f.tracker->ReportLocation("drv-1", {28.6139, 77.2090}, 0);

  // ~55 m north
  f.now += 1000;
  const auto small = f.tracker->ReportLocation("drv-1", {28.6144, 77.2090}, 10);
  assert(!small.updated);
  assert(small.distance_meters.has_value());
  assert(*small.distance_meters > 50 && *small.distance_meters < 60);
  assert(f.Driver("drv-1").last_lat == 28.6139);
  assert(f.Driver("drv-1").location_updated_at_ms == 7'000'000);
  assert(f.Published() == 1);

  // ~111 m north of the stored position
  f.now += 1000;
  const auto moved = f.tracker->ReportLocation("drv-1", {28.6149, 77.2090}, 10);
  assert(moved.updated);
  assert(*moved.distance_meters > 105 && *moved.distance_meters < 115);
  assert(f.Driver("drv-1").last_lat == 28.6149);
  assert(f.Published() == 2);
}

void TestParkedDriverStaysIndexed() {
  Fixture f(200);
  f.AddDriver("drv-1", true);
  f.tracker->ReportLocation("drv-1", {28.6139, 77.2090}, 30);

  // a parked driver keeps reporting jitter well under the movement threshold
  for (int i = 0; i < 3; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    f.now += 120;
    const auto jitter = f.tracker->ReportLocation("drv-1", {28.6140, 77.2091}, 30);
    assert(!jitter.updated);
  }

  // 360 ms since the last real update, past the 200 ms entry ttl
  const auto indexed = f.backend->Position("drv-1");
  assert(indexed.has_value());
  assert(indexed->latitude == 28.6139);
  assert(indexed->longitude == 77.2090);
  assert(f.Driver("drv-1").location_updated_at_ms == 7'000'000);
  assert(f.Published() == 1);
}

void TestRejectedReports() {
  Fixture f;
  f.AddDriver("drv-off", false);

  ExpectRejected<util::NotFound>(f, "drv-missing", {28.6, 77.2}, "DRIVER_NOT_FOUND");
  ExpectRejected<util::DriverOffline>(f, "drv-off", {28.6, 77.2}, "DRIVER_OFFLINE");
  ExpectRejected<util::ValidationFailed>(f, "drv-off", {91.0, 77.2}, "INVALID_INPUT");

  assert(!f.Driver("drv-off").has_position);
  assert(f.Published() == 0);
}

void TestActiveOrderChannelGetsPosition() {
  Fixture f;
  f.AddDriver("drv-1", true);

  db::model::OrderRecord order;
  order.id        = "o-live";
  order.type      = ORDER_TYPE_RIDE;
  order.status    = ORDER_STATUS_DRIVER_ARRIVING;
  order.rider_id  = "rider-1";
  order.driver_id = "drv-1";
  order.otp       = "1234";
  {
    auto       tx       = f.repo->Begin();
    const auto inserted = f.repo->InsertOrder(*tx, order);
    assert(inserted);
    tx->Commit();
  }

  auto       watcher = std::make_shared<CapturingConnection>();
  const auto id      = f.gateway->Connect({"rider-1", auth::Role::kRider}, watcher);
  f.gateway->Subscribe(id, realtime::OrderChannel("o-live"));

  f.tracker->ReportLocation("drv-1", {28.6139, 77.2090}, 90);

  const auto locations = watcher->Locations();
  assert(locations.size() == 1);
  assert(locations[0].driver_location().driver_id() == "drv-1");
  assert(locations[0].driver_location().order_id() == "o-live");
  assert(locations[0].driver_location().heading() == 90);
}

} // namespace

int main() {
  TestFirstReportIsStoredIndexedAndPublished();
  TestSmallMovementIsSuppressed();
  TestParkedDriverStaysIndexed();
  TestRejectedReports();
  TestActiveOrderChannelGetsPosition();
  std::cout << "location_tracker_test: pass\n";
  return 0;
}
