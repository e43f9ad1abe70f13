#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace dispatch::runtime::config {
class RuntimeConfig;
}

namespace dispatch::observability {

// One key=value pair appended to a log line. Values containing spaces are quoted.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

/*
  Installs the process logger. Level, pattern and trace context come from
  the config, each overridable through DISPATCH_LOG_LEVEL,
  DISPATCH_LOG_PATTERN and DISPATCH_LOG_INCLUDE_TRACE_CONTEXT. The default
  pattern tags every line with the instance id so interleaved output from
  several gateway processes stays attributable.
*/
void InitializeLogging(const dispatch::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace dispatch::observability

#define DISPATCH_LOG_DEBUG(message, ...) ::dispatch::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define DISPATCH_LOG_INFO(message, ...) ::dispatch::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define DISPATCH_LOG_WARN(message, ...) ::dispatch::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define DISPATCH_LOG_ERROR(message, ...) ::dispatch::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
