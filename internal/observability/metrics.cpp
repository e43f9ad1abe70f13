#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <utility>

#include <opentelemetry/common/key_value_iterable_view.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include "config/config.pb.h"
#include "internal/observability/otlp_target.hpp"

namespace dispatch::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

using Attributes = std::map<std::string, std::string>;
using AttrView   = opentelemetry::common::KeyValueIterableView<Attributes>;

constexpr uint32_t kDefaultCollectionMs = 1000;

std::mutex                                 g_mutex;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpTarget& target) {
  if (target.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = !target.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

// SDK releases disagree on whether readers are passed by unique_ptr or shared_ptr.
void AttachReader(sdkmetrics::MeterProvider& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider.AddMetricReader(std::move(reader)); }) {
    provider.AddMetricReader(std::move(reader));
  } else {
    provider.AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

// Same story for the explicit context argument on Add and Record.
template <typename Instrument, typename Value>
void Add(Instrument& instrument, Value value, const Attributes& attributes) {
  const AttrView view(attributes);
  if constexpr (requires { instrument->Add(value, view, opentelemetry::context::Context{}); }) {
    instrument->Add(value, view, opentelemetry::context::Context{});
  } else {
    instrument->Add(value, view);
  }
}

template <typename Instrument, typename Value>
void Record(Instrument& instrument, Value value, const Attributes& attributes) {
  const AttrView view(attributes);
  if constexpr (requires { instrument->Record(value, view, opentelemetry::context::Context{}); }) {
    instrument->Record(value, view, opentelemetry::context::Context{});
  } else {
    instrument->Record(value, view);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<uint64_t>> requests;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>> request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>> geo_query_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<uint64_t>> dispatch_events;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument> connections_gauge;

  // Last reported count per role, read by the gauge callback.
  std::mutex                      connections_mutex;
  std::map<std::string, int64_t> connections;

  static void ObserveConnections(metrics_api::ObserverResult result, void* state) {
    auto* impl     = static_cast<Impl*>(state);
    auto  observer = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<int64_t>>>(result);

    std::lock_guard<std::mutex> lock(impl->connections_mutex);
    for (const auto& [role, count] : impl->connections) {
      const Attributes attributes = {{"role", role}};
      observer->Observe(count, AttrView(attributes));
    }
  }
};

bool InitializeMetrics(const dispatch::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto target = ResolveOtlpTarget(config, OtlpSignal::kMetrics);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto collection_ms = observability.metrics().collection_interval_ms();
  reader_options.export_interval_millis = std::chrono::milliseconds(collection_ms > 0 ? collection_ms : kDefaultCollectionMs);
  if (observability.metrics().export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(observability.metrics().export_timeout_ms());
  }

  auto provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), MakeResource(target));
  AttachReader(*provider, sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(target), reader_options));

  std::lock_guard<std::mutex> lock(g_mutex);
  g_provider = std::move(provider);
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
    g_provider.reset();
  }
}

// Instruments bind to whichever provider is installed on first use, so
// InitializeMetrics must run before the first Instance() call to export.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("dispatch", "0.1.0");

  impl_->requests           = impl_->meter->CreateUInt64Counter("dispatch.rpc.requests", "Handled RPCs by route and outcome", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("dispatch.rpc.latency_ms", "RPC handling latency", "ms");
  impl_->geo_query_ms       = impl_->meter->CreateDoubleHistogram("dispatch.geo.query_ms", "Nearby driver query latency by path", "ms");
  impl_->dispatch_events    = impl_->meter->CreateUInt64Counter("dispatch.order.events", "Offers, timeouts and order transitions", "1");
  impl_->connections_gauge =
      impl_->meter->CreateInt64ObservableGauge("dispatch.realtime.connections", "Realtime clients connected to this process", "1");
  impl_->connections_gauge->AddCallback(&Impl::ObserveConnections, impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  Add(impl_->requests, uint64_t{1}, {{"route", std::string(route)}, {"outcome", success ? "ok" : "error"}});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  Record(impl_->request_latency_ms, latency_ms, {{"route", std::string(route)}});
}

void Metrics::ObserveGeoQueryMs(std::string_view path, double latency_ms) {
  Record(impl_->geo_query_ms, latency_ms, {{"path", std::string(path)}});
}

void Metrics::RecordDispatchEvent(std::string_view kind) {
  Add(impl_->dispatch_events, uint64_t{1}, {{"kind", std::string(kind)}});
}

void Metrics::SetRealtimeConnections(std::string_view role, std::int64_t count) {
  std::lock_guard<std::mutex> lock(impl_->connections_mutex);
  impl_->connections[std::string(role)] = count;
}

} // namespace dispatch::observability

#endif
