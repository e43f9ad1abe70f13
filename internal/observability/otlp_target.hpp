#pragma once

#ifdef ENABLE_OTEL

#include <string>

#include <opentelemetry/sdk/resource/resource.h>

namespace dispatch::runtime::config {
class RuntimeConfig;
}

namespace dispatch::observability {

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

// Where one signal is exported and how this process identifies itself.
struct OtlpTarget {
  std::string endpoint;
  bool        http     = false;
  bool        insecure = true;
  std::string service_name{"dispatchd"};
  std::string instance_id;
};

// Endpoint precedence: config, OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
// OTEL_EXPORTER_OTLP_ENDPOINT, then the local collector default.
OtlpTarget ResolveOtlpTarget(const dispatch::runtime::config::RuntimeConfig& config, OtlpSignal signal);

// service.name plus service.instance.id, so every gateway process reports separately.
opentelemetry::sdk::resource::Resource MakeResource(const OtlpTarget& target);

} // namespace dispatch::observability

#endif
