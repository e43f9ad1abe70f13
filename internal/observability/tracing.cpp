#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <mutex>
#include <utility>

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include "config/config.pb.h"
#include "internal/observability/otlp_target.hpp"

namespace dispatch::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

using ProcessorType = dispatch::runtime::config::ObservabilityConfig_TracingConfig_TraceProcessorType;

namespace {

constexpr const char* kTracerName    = "dispatch";
constexpr const char* kTracerVersion = "0.1.0";

// Guarded by g_mutex. The tracer is fetched lazily so spans opened before
// InitializeTracing (or without it) stay no-ops.
std::mutex                                          g_mutex;
std::shared_ptr<sdktrace::TracerProvider>           g_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpTarget& target) {
  if (target.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = !target.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

std::unique_ptr<sdktrace::SpanProcessor> MakeProcessor(ProcessorType type, std::unique_ptr<sdktrace::SpanExporter> exporter) {
  if (type == dispatch::runtime::config::ObservabilityConfig_TracingConfig_TraceProcessorType_TRACE_PROCESSOR_SIMPLE) {
    return sdktrace::SimpleSpanProcessorFactory::Create(std::move(exporter));
  }
  return sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), sdktrace::BatchSpanProcessorOptions{});
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> CurrentTracer() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (!g_tracer) {
    g_tracer = trace_api::Provider::GetTracerProvider()->GetTracer(kTracerName, kTracerVersion);
  }
  return g_tracer;
}

} // namespace

bool InitializeTracing(const dispatch::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto target    = ResolveOtlpTarget(config, OtlpSignal::kTraces);
  auto       processor = MakeProcessor(config.observability().tracing().processor(), MakeExporter(target));
  std::shared_ptr<sdktrace::TracerProvider> provider = sdktrace::TracerProviderFactory::Create(std::move(processor), MakeResource(target));

  std::lock_guard<std::mutex> lock(g_mutex);
  g_provider = std::move(provider);
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  g_tracer = g_provider->GetTracer(kTracerName, kTracerVersion);
  return true;
}

void ShutdownTracing() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
    g_provider.reset();
  }
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  trace_api::Scope                                  scope;

  explicit Impl(opentelemetry::nostd::shared_ptr<trace_api::Span> s) : span(s), scope(s) {
  }
};

SpanScope::SpanScope(std::string_view name) {
  auto tracer = CurrentTracer();
  if (tracer) {
    impl_ = std::make_unique<Impl>(tracer->StartSpan(std::string(name)));
  }
}

SpanScope::~SpanScope() {
  if (impl_) {
    impl_->span->End();
  }
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (impl_) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
  }
}

} // namespace dispatch::observability

#endif
