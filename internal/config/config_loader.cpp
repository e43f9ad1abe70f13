#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <unistd.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace dispatch::config {

using dispatch::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;

  // an empty document is a valid all-defaults config
  if (yaml.IsDefined() && !yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

static std::string DefaultInstanceId() {
  char host[256] = {0};
  if (gethostname(host, sizeof(host) - 1) != 0 || host[0] == '\0') {
    return "dispatchd-" + std::to_string(getpid());
  }
  return std::string(host) + "-" + std::to_string(getpid());
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50061");
  if (server->instance_id().empty()) server->set_instance_id(DefaultInstanceId());

  if (config.database().backend_case() == dispatch::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }

  auto* dispatch = config.mutable_dispatch();
  if (dispatch->search_radius_km() <= 0) dispatch->set_search_radius_km(10.0);
  if (dispatch->accept_timeout_ms() == 0) dispatch->set_accept_timeout_ms(30'000);
  if (dispatch->sweep_interval_ms() == 0) dispatch->set_sweep_interval_ms(1'000);
  if (dispatch->candidate_limit() == 0) dispatch->set_candidate_limit(20);
  if (dispatch->road_distance_factor() <= 0) dispatch->set_road_distance_factor(1.4);
  if (dispatch->average_speed_kmh() <= 0) dispatch->set_average_speed_kmh(30.0);

  auto* geo = config.mutable_geo();
  if (geo->entry_ttl_ms() == 0) geo->set_entry_ttl_ms(300'000);
  if (geo->query_timeout_ms() == 0) geo->set_query_timeout_ms(5'000);
  if (geo->upsert_timeout_ms() == 0) geo->set_upsert_timeout_ms(3'000);
  if (geo->movement_threshold_m() <= 0) geo->set_movement_threshold_m(80.0);
  if (geo->worker_threads() == 0) geo->set_worker_threads(2);

  auto* realtime = config.mutable_realtime();
  if (realtime->heartbeat_interval_ms() == 0) realtime->set_heartbeat_interval_ms(30'000);
  if (realtime->liveness_timeout_ms() == 0) realtime->set_liveness_timeout_ms(60'000);

  auto* cluster = config.mutable_cluster();
  if (cluster->publish_timeout_ms() == 0) cluster->set_publish_timeout_ms(1'000);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& db = config.database();
  if (db.has_sqlite() && db.sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (db.has_postgres() && db.postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }

  for (const auto& fare : config.dispatch().fares()) {
    if (fare.vehicle_class().empty()) {
      throw std::runtime_error("Invalid configuration: dispatch.fares entry without vehicle_class");
    }
    if (fare.base_fare() < 0 || fare.per_km() < 0 || fare.per_minute() < 0 || fare.minimum_fare() < 0) {
      throw std::runtime_error("Invalid configuration: negative fare for " + fare.vehicle_class());
    }
  }

  if (config.realtime().heartbeat_interval_ms() >= config.realtime().liveness_timeout_ms()) {
    throw std::runtime_error("Invalid configuration: realtime.heartbeat_interval_ms must be below liveness_timeout_ms");
  }

  for (const auto& peer : config.cluster().peers()) {
    if (peer.empty()) {
      throw std::runtime_error("Invalid configuration: empty cluster peer address");
    }
  }
}

} // namespace dispatch::config
