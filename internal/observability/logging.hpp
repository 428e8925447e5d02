#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace depgraph::runtime::config {
class RuntimeConfig;
}

namespace depgraph::observability {

// One key=value pair appended to a log line.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
// Fixed three decimals, for durations in milliseconds.
LogField DoubleField(std::string_view key, double value);

/*
  Configures the "depgraph" spdlog logger from config.logging.
  DEPGRAPH_LOG_LEVEL and DEPGRAPH_LOG_PATTERN override the file.
  Until this runs, Log() writes through spdlog's default logger.
*/
void InitializeLogging(const depgraph::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Emits "message key=value ..." when the level is enabled.
void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace depgraph::observability

#define DEPGRAPH_LOG_DEBUG(message, ...) ::depgraph::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define DEPGRAPH_LOG_INFO(message, ...) ::depgraph::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define DEPGRAPH_LOG_WARN(message, ...) ::depgraph::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define DEPGRAPH_LOG_ERROR(message, ...) ::depgraph::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
