#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/async/task_worker.hpp"
#include "internal/auth/identity.hpp"
#include "internal/cluster/grpc_cluster_bus.hpp"
#include "internal/cluster/local_cluster_bus.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/engine/dispatch_engine.hpp"
#include "internal/engine/search_sweeper.hpp"
#include "internal/geo/geo_index.hpp"
#include "internal/geo/memory_geo_backend.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/cluster_server.hpp"
#include "internal/grpc/driver_server.hpp"
#include "internal/grpc/order_server.hpp"
#include "internal/grpc/realtime_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/realtime/liveness_monitor.hpp"
#include "internal/realtime/realtime_gateway.hpp"
#include "internal/realtime/realtime_notification_sink.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/driver_service.hpp"
#include "internal/service/order_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/tracking/location_tracker.hpp"
#if DISPATCH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif
#if DISPATCH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace dispatch::factory {

using dispatch::runtime::config::RuntimeConfig;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if DISPATCH_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if DISPATCH_DB_POSTGRES
    const auto& pg = database.postgres();
    db::postgres::BootstrapSchema(pg.connection_uri());
    db::postgres::PgPoolOptions pool_options;
    pool_options.connection_uri = pg.connection_uri();
    if (pg.max_connections() > 0) {
      pool_options.max_connections = pg.max_connections();
    }
    auto pool = std::make_shared<db::postgres::PgPool>(std::move(pool_options));
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

engine::EngineOptions EngineOptionsFrom(const RuntimeConfig& config) {
  const auto& d = config.dispatch();

  engine::EngineOptions options;
  options.search_radius_km     = d.search_radius_km();
  options.accept_timeout_ms    = d.accept_timeout_ms();
  options.max_search_attempts  = d.max_search_attempts();
  options.candidate_limit      = d.candidate_limit();
  options.road_distance_factor = d.road_distance_factor();
  options.average_speed_kmh    = d.average_speed_kmh();
  return options;
}

} // namespace

void Application::Stop() {
  if (sweeper) sweeper->Stop();
  if (liveness) liveness->Stop();
  if (worker) worker->Stop();
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  const std::string& instance_id = config.server().instance_id();

  // ------------------------------------------------------------------
  // Shared infrastructure
  // ------------------------------------------------------------------
  // Past this backlog the geo and relay paths fail fast instead of queueing behind a stalled backend.
  const size_t io_threads = config.geo().worker_threads();
  app.worker              = std::make_shared<async::TaskWorker>("dispatch-io", io_threads, io_threads * 256);
  app.worker->Start();

  auto repository = BuildRepository(config);

  std::shared_ptr<cluster::ClusterBus>     bus;
  std::shared_ptr<cluster::GrpcClusterBus> grpc_bus;
  if (config.cluster().peers_size() > 0) {
    cluster::GrpcClusterBusOptions bus_options;
    bus_options.instance_id        = instance_id;
    bus_options.peers              = {config.cluster().peers().begin(), config.cluster().peers().end()};
    bus_options.publish_timeout_ms = config.cluster().publish_timeout_ms();
    grpc_bus                       = std::make_shared<cluster::GrpcClusterBus>(std::move(bus_options), app.worker);
    bus                            = grpc_bus;
  } else {
    bus = std::make_shared<cluster::LocalClusterBus>();
  }

  geo::GeoIndexOptions geo_options;
  geo_options.entry_ttl_ms      = config.geo().entry_ttl_ms();
  geo_options.query_timeout_ms  = config.geo().query_timeout_ms();
  geo_options.upsert_timeout_ms = config.geo().upsert_timeout_ms();
  auto geo_index = std::make_shared<geo::GeoIndex>(std::make_shared<geo::MemoryGeoBackend>(), repository, app.worker, geo_options);

  // ------------------------------------------------------------------
  // Realtime
  // ------------------------------------------------------------------
  realtime::GatewayOptions gateway_options;
  gateway_options.instance_id           = instance_id;
  gateway_options.heartbeat_interval_ms = config.realtime().heartbeat_interval_ms();
  gateway_options.liveness_timeout_ms   = config.realtime().liveness_timeout_ms();
  auto gateway = std::make_shared<realtime::RealtimeGateway>(gateway_options, bus, geo_index);
  gateway->Start();

  // ------------------------------------------------------------------
  // Dispatch core
  // ------------------------------------------------------------------
  auto engine = std::make_shared<engine::DispatchEngine>(repository, geo_index, engine::FareTable(config.dispatch().fares()), EngineOptionsFrom(config));
  engine->AddSink(std::make_shared<realtime::RealtimeNotificationSink>(gateway));

  tracking::TrackerOptions tracker_options;
  tracker_options.movement_threshold_m = config.geo().movement_threshold_m();
  auto tracker = std::make_shared<tracking::LocationTracker>(repository, geo_index, bus, gateway, tracker_options);

  gateway->SetLocationHandler([tracker](const auth::Identity& identity, const dispatch::realtime::v1::ClientMessage::DriverLocation& location) {
    tracker->ReportLocation(identity.id, geo::Coordinates{location.latitude(), location.longitude()}, location.heading());
  });

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository  = repository;
  ctx.engine      = engine;
  ctx.geo         = geo_index;
  ctx.tracker     = tracker;
  ctx.gateway     = gateway;
  ctx.instance_id = instance_id;

  auto order_service  = std::make_shared<service::OrderService>(ctx);
  auto driver_service = std::make_shared<service::DriverService>(ctx);
  auto admin_service  = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  auto verifier = std::make_shared<auth::MetadataIdentityVerifier>();

  app.grpc_services.push_back(std::make_unique<grpc::OrderServer>(order_service, verifier));
  app.grpc_services.push_back(std::make_unique<grpc::DriverServer>(driver_service, verifier));
  app.grpc_services.push_back(std::make_unique<grpc::RealtimeServer>(gateway, verifier));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));
  if (grpc_bus) {
    app.grpc_services.push_back(std::make_unique<grpc::ClusterServer>(grpc_bus));
  }

  // ------------------------------------------------------------------
  // Background workers
  // ------------------------------------------------------------------
  app.sweeper = std::make_shared<engine::SearchSweeper>(engine, config.dispatch().sweep_interval_ms());
  app.sweeper->Start();

  app.liveness = std::make_shared<realtime::LivenessMonitor>(gateway);
  app.liveness->Start();

  DISPATCH_LOG_INFO("application built", {observability::StringField("instance_id", instance_id),
                                          observability::IntField("cluster_peers", config.cluster().peers_size()),
                                          observability::BoolField("persistent", !config.database().has_memory())});
  return app;
}

} // namespace dispatch::factory
