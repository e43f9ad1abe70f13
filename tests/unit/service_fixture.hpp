#pragma once

#include <memory>
#include <string>

#include "internal/async/task_worker.hpp"
#include "internal/cluster/local_cluster_bus.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/engine/dispatch_engine.hpp"
#include "internal/geo/geo_index.hpp"
#include "internal/geo/memory_geo_backend.hpp"
#include "internal/realtime/realtime_gateway.hpp"
#include "internal/realtime/realtime_notification_sink.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/driver_service.hpp"
#include "internal/service/order_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/tracking/location_tracker.hpp"

namespace dispatch::testing {

// Single-process wiring over the in-memory backends.
class ServiceFixture {
 public:
  ServiceFixture() {
    worker->Start();

    ctx.repository  = repo;
    ctx.instance_id = "node-test";
    ctx.geo         = std::make_shared<geo::GeoIndex>(std::make_shared<geo::MemoryGeoBackend>(), repo, worker, geo::GeoIndexOptions{});
    ctx.gateway     = std::make_shared<realtime::RealtimeGateway>(realtime::GatewayOptions{"node-test"}, bus, ctx.geo);
    ctx.gateway->Start();
    ctx.engine = std::make_shared<engine::DispatchEngine>(repo, ctx.geo, engine::FareTable(), engine::EngineOptions{});
    ctx.engine->AddSink(std::make_shared<realtime::RealtimeNotificationSink>(ctx.gateway));
    ctx.tracker = std::make_shared<tracking::LocationTracker>(repo, ctx.geo, bus, ctx.gateway, tracking::TrackerOptions{});

    orders  = std::make_shared<service::OrderService>(ctx);
    drivers = std::make_shared<service::DriverService>(ctx);
    admin   = std::make_shared<service::AdminService>(ctx);
  }

  ~ServiceFixture() {
    worker->Stop();
  }

  // Registers, brings online and positions a driver.
  void OnlineDriver(const std::string& id, double lat, double lng, const std::string& vehicle_class = "CAR") {
    const auth::Identity caller{id, auth::Role::kDriver};

    dispatch::services::v1::RegisterDriverRequest registration;
    registration.mutable_vehicle()->set_vehicle_class(vehicle_class);
    registration.mutable_vehicle()->set_plate("PLATE-" + id);
    drivers->RegisterDriver(caller, registration);

    dispatch::services::v1::SetAvailabilityRequest availability;
    availability.set_online(true);
    drivers->SetAvailability(caller, availability);

    dispatch::services::v1::ReportLocationRequest location;
    location.set_latitude(lat);
    location.set_longitude(lng);
    drivers->ReportLocation(caller, location);
  }

  static dispatch::services::v1::CreateOrderRequest RideRequest() {
    dispatch::services::v1::CreateOrderRequest req;
    req.set_type(dispatch::core::v1::ORDER_TYPE_RIDE);
    req.mutable_pickup()->mutable_point()->set_latitude(-33.8688);
    req.mutable_pickup()->mutable_point()->set_longitude(151.2093);
    req.mutable_pickup()->set_address("George St");
    req.mutable_dropoff()->mutable_point()->set_latitude(-33.8915);
    req.mutable_dropoff()->mutable_point()->set_longitude(151.2767);
    req.mutable_dropoff()->set_address("Bondi Beach");
    return req;
  }

  std::shared_ptr<db::memory::MemoryRepository> repo   = std::make_shared<db::memory::MemoryRepository>();
  std::shared_ptr<async::TaskWorker>            worker = std::make_shared<async::TaskWorker>("service-test", 2);
  std::shared_ptr<cluster::LocalClusterBus>     bus    = std::make_shared<cluster::LocalClusterBus>();
  service::ServiceContext                       ctx;

  std::shared_ptr<service::OrderService>  orders;
  std::shared_ptr<service::DriverService> drivers;
  std::shared_ptr<service::AdminService>  admin;
};

} // namespace dispatch::testing
