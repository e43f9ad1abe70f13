#include "internal/observability/otlp_target.hpp"

#ifdef ENABLE_OTEL

#include <cstdlib>

#include "config/config.pb.h"

namespace dispatch::observability {

OtlpTarget ResolveOtlpTarget(const dispatch::runtime::config::RuntimeConfig& config, OtlpSignal signal) {
  const auto& observability = config.observability();

  OtlpTarget target;
  target.http        = observability.transport() == dispatch::runtime::config::OTLP_TRANSPORT_HTTP;
  target.instance_id = config.server().instance_id();

  const char* signal_env = signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  if (!observability.otlp_endpoint().empty()) {
    target.endpoint = observability.otlp_endpoint();
  } else if (const char* endpoint = std::getenv(signal_env)) {
    target.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    target.endpoint = endpoint;
  } else if (target.http) {
    target.endpoint = signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
  } else {
    target.endpoint = "localhost:4317";
  }
  return target;
}

opentelemetry::sdk::resource::Resource MakeResource(const OtlpTarget& target) {
  opentelemetry::sdk::resource::ResourceAttributes attrs = {{"service.name", target.service_name}};
  if (!target.instance_id.empty()) {
    attrs.SetAttribute("service.instance.id", target.instance_id);
  }
  return opentelemetry::sdk::resource::Resource::Create(attrs);
}

} // namespace dispatch::observability

#endif
