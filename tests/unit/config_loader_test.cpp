#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using dispatch::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "dispatch_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejected(const std::string& yaml, const std::string& expected_fragment) {
  try {
    (void)ConfigLoader::LoadFromString(yaml);
  } catch (const std::runtime_error& e) {
    return std::string(e.what()).find(expected_fragment) != std::string::npos;
  }
  return false;
}

void TestEmptyDocumentGetsDefaults() {
  const auto config = ConfigLoader::LoadFromString("");

  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(!config.server().instance_id().empty());
  assert(config.database().has_memory());

  assert(config.dispatch().search_radius_km() == 10.0);
  assert(config.dispatch().accept_timeout_ms() == 30'000);
  assert(config.dispatch().sweep_interval_ms() == 1'000);
  assert(config.dispatch().max_search_attempts() == 0);
  assert(config.dispatch().candidate_limit() == 20);
  assert(config.dispatch().road_distance_factor() == 1.4);
  assert(config.dispatch().average_speed_kmh() == 30.0);
  assert(config.dispatch().fares_size() == 0);

  assert(config.geo().entry_ttl_ms() == 300'000);
  assert(config.geo().query_timeout_ms() == 5'000);
  assert(config.geo().upsert_timeout_ms() == 3'000);
  assert(config.geo().movement_threshold_m() == 80.0);
  assert(config.geo().worker_threads() == 2);

  assert(config.realtime().heartbeat_interval_ms() == 30'000);
  assert(config.realtime().liveness_timeout_ms() == 60'000);
  assert(config.cluster().publish_timeout_ms() == 1'000);
  assert(config.cluster().peers_size() == 0);
}

void TestFullFileIsLoaded() {
  const auto yaml_path = WriteYaml("full", R"(server:
  bind_address: "127.0.0.1:7000"
  instance_id: "dispatch-1"
database:
  sqlite:
    path: "/tmp/dispatch.db"
logging:
  level: "debug"
observability:
  tracing_enabled: false
  transport: "OTLP_TRANSPORT_GRPC"
dispatch:
  search_radius_km: 5
  accept_timeout_ms: 15000
  max_search_attempts: 4
  fares:
    - vehicle_class: "CAR"
      base_fare: 3
      per_km: 1.5
      per_minute: 0.25
      minimum_fare: 6
    - vehicle_class: "MOTORCYCLE"
      base_fare: 1
      per_km: 0.5
      per_minute: 0.1
      minimum_fare: 2
geo:
  movement_threshold_m: 25
realtime:
  heartbeat_interval_ms: 10000
  liveness_timeout_ms: 25000
cluster:
  peers: ["10.0.0.2:7000", "10.0.0.3:7000"]
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:7000");
  assert(config.server().instance_id() == "dispatch-1");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/dispatch.db");
  assert(config.logging().level() == "debug");
  assert(config.observability().transport() == dispatch::runtime::config::OTLP_TRANSPORT_GRPC);

  assert(config.dispatch().search_radius_km() == 5.0);
  assert(config.dispatch().accept_timeout_ms() == 15'000);
  assert(config.dispatch().max_search_attempts() == 4);
  // untouched fields still get defaults
  assert(config.dispatch().sweep_interval_ms() == 1'000);

  assert(config.dispatch().fares_size() == 2);
  assert(config.dispatch().fares(0).vehicle_class() == "CAR");
  assert(config.dispatch().fares(0).per_minute() == 0.25);
  assert(config.dispatch().fares(1).minimum_fare() == 2.0);

  assert(config.geo().movement_threshold_m() == 25.0);
  assert(config.geo().entry_ttl_ms() == 300'000);
  assert(config.realtime().heartbeat_interval_ms() == 10'000);
  assert(config.cluster().peers_size() == 2);
  assert(config.cluster().peers(1) == "10.0.0.3:7000");
}

void TestQuotedScalarsKeepTheirText() {
  const auto config = ConfigLoader::LoadFromString(R"(database:
  sqlite:
    path: "C:\\dispatch\\\"quoted\"\\db.sqlite"
server:
  bind_address: "line1\nline2☃"
)");
  assert(config.database().sqlite().path() == "C:\\dispatch\\\"quoted\"\\db.sqlite");
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestPostgresBackend() {
  const auto config = ConfigLoader::LoadFromString(R"(database:
  postgres:
    connection_uri: "postgresql://dispatch@localhost/dispatch"
    max_connections: 8
)");
  assert(config.database().has_postgres());
  assert(config.database().postgres().max_connections() == 8);
}

void TestUnknownFieldsAreRejected() {
  assert(Rejected("server:\n  bind_address: \"0.0.0.0:1\"\nunknown_field: 123\n", "Invalid configuration"));
  assert(Rejected("dispatch:\n  search_radius: 3\n", "Invalid configuration"));
}

void TestInvalidValuesAreRejected() {
  assert(Rejected("database:\n  sqlite:\n    path: \"\"\n", "database.sqlite.path"));
  assert(Rejected("database:\n  postgres:\n    max_connections: 4\n", "connection_uri"));
  assert(Rejected("dispatch:\n  fares:\n    - base_fare: 2\n", "vehicle_class"));
  assert(Rejected("dispatch:\n  fares:\n    - vehicle_class: \"CAR\"\n      per_km: -1\n", "negative fare"));
  assert(Rejected("realtime:\n  heartbeat_interval_ms: 60000\n  liveness_timeout_ms: 60000\n", "heartbeat_interval_ms"));
  assert(Rejected("cluster:\n  peers: [\"\"]\n", "peer"));
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/dispatchd.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

void TestApplyDefaultsIsIdempotent() {
  dispatch::runtime::config::RuntimeConfig config;
  config.mutable_server()->set_instance_id("fixed");
  ConfigLoader::ApplyDefaults(config);
  const auto once = config.SerializeAsString();
  ConfigLoader::ApplyDefaults(config);
  assert(config.SerializeAsString() == once);
  ConfigLoader::Validate(config);
}

} // namespace

int main() {
  TestEmptyDocumentGetsDefaults();
  TestFullFileIsLoaded();
  TestQuotedScalarsKeepTheirText();
  TestPostgresBackend();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestMissingFileIsReported();
  TestApplyDefaultsIsIdempotent();

  std::cout << "config_loader_test: pass\n";
  return 0;
}
