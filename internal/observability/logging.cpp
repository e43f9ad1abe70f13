#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <iterator>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace dispatch::observability {
namespace {

constexpr const char* kLoggerName = "dispatchd";

std::atomic<bool> g_trace_context{false};

// Environment first, then the configured value, then the built-in default.
std::string Setting(const char* env, const std::string& configured, std::string fallback) {
  if (const char* value = std::getenv(env)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool Truthy(const std::string& value) {
  return value == "1" || value == "true" || value == "yes";
}

void AppendField(fmt::memory_buffer& line, const LogField& field) {
  const bool quote = field.value.empty() || field.value.find_first_of(" =\"") != std::string::npos;
  if (quote) {
    fmt::format_to(std::back_inserter(line), " {}=\"{}\"", field.key, field.value);
  } else {
    fmt::format_to(std::back_inserter(line), " {}={}", field.key, field.value);
  }
}

#ifdef ENABLE_OTEL
void AppendTraceContext(fmt::memory_buffer& line) {
  if (!g_trace_context.load(std::memory_order_relaxed)) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span || !span->GetContext().IsValid()) {
    return;
  }

  char trace_id[32];
  char span_id[16];
  span->GetContext().trace_id().ToLowerBase16(trace_id);
  span->GetContext().span_id().ToLowerBase16(span_id);
  fmt::format_to(std::back_inserter(line), " trace_id={} span_id={}", std::string_view(trace_id, sizeof(trace_id)),
                 std::string_view(span_id, sizeof(span_id)));
}
#else
void AppendTraceContext(fmt::memory_buffer&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.3f}", value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const dispatch::runtime::config::RuntimeConfig& config) {
  const auto& logging  = config.logging();
  const auto  instance = config.server().instance_id().empty() ? std::string(kLoggerName) : config.server().instance_id();

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(Setting("DISPATCH_LOG_PATTERN", logging.pattern(), "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [" + instance + "] %v"));
  logger->set_level(spdlog::level::from_str(Setting("DISPATCH_LOG_LEVEL", logging.level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  g_trace_context = Truthy(Setting("DISPATCH_LOG_INCLUDE_TRACE_CONTEXT", logging.include_trace_context() ? "true" : "", "false"));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  fmt::memory_buffer line;
  line.append(message.data(), message.data() + message.size());
  for (const auto& field : fields) {
    AppendField(line, field);
  }
  AppendTraceContext(line);

  spdlog::log(level, "{}", std::string_view(line.data(), line.size()));
}

} // namespace dispatch::observability
