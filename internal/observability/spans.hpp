#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace dispatch::runtime::config {
class RuntimeConfig;
}

namespace dispatch::observability {

// Both return false when the signal is disabled in config or the build has no OpenTelemetry.
bool InitializeTracing(const dispatch::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const dispatch::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// Active span for the current scope. Inert when tracing is off.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide instruments. Every call is a no-op until InitializeMetrics
  installed a provider. Builds without OpenTelemetry link the inert
  definitions in telemetry_disabled.cpp.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // path is "primary" or "fallback"
  void ObserveGeoQueryMs(std::string_view path, double latency_ms);

  // kind: offered, accepted, declined, search_timeout, cancelled, completed, ...
  void RecordDispatchEvent(std::string_view kind);

  void SetRealtimeConnections(std::string_view role, std::int64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

} // namespace dispatch::observability
