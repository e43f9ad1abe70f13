#include "internal/observability/spans.hpp"

namespace dispatch::observability {

bool InitializeTracing(const dispatch::runtime::config::RuntimeConfig&) {
  return false;
}

bool InitializeMetrics(const dispatch::runtime::config::RuntimeConfig&) {
  return false;
}

void ShutdownTracing() {
}

void ShutdownMetrics() {
}

SpanScope::SpanScope(std::string_view) {
}

SpanScope::~SpanScope() = default;

void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

void SpanScope::RecordException(std::string_view) {
}

Metrics::Metrics() = default;

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view, bool) {
}

void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

void Metrics::ObserveGeoQueryMs(std::string_view, double) {
}

void Metrics::RecordDispatchEvent(std::string_view) {
}

void Metrics::SetRealtimeConnections(std::string_view, std::int64_t) {
}

} // namespace dispatch::observability
