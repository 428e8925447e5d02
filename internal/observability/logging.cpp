#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <optional>
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

namespace depgraph::observability {
namespace {

constexpr const char* kLoggerName     = "depgraph";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

// Environment overrides config; empty values count as unset.
std::optional<std::string> Env(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::string EnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (auto value = Env(name)) {
    return *value;
  }
  return configured.empty() ? fallback : configured;
}

// spdlog maps unknown names to "off"; keep logging on instead.
spdlog::level::level_enum ParseLevel(const std::string& name, bool* recognized) {
  auto level  = spdlog::level::from_str(name);
  *recognized = level != spdlog::level::off || name == "off";
  return *recognized ? level : spdlog::level::info;
}

void AppendValue(std::string* out, const std::string& value) {
  if (value.empty() || value.find_first_of(" \t\"=") != std::string::npos) {
    out->push_back('"');
    for (char c : value) {
      if (c == '"' || c == '\\') out->push_back('\\');
      out->push_back(c);
    }
    out->push_back('"');
    return;
  }
  out->append(value);
}

#ifdef ENABLE_OTEL
void AppendHex(std::string* out, const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (std::size_t i = 0; i < size; ++i) {
    out->push_back(kHex[(data[i] >> 4) & 0x0F]);
    out->push_back(kHex[data[i] & 0x0F]);
  }
}

void AppendTraceContext(std::string* out) {
  if (!g_include_trace_context) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }

  const auto context = span->GetContext();
  if (!context.IsValid() || !context.trace_id().IsValid() || !context.span_id().IsValid()) {
    return;
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);

  out->append(" trace_id=");
  AppendHex(out, trace_bytes, sizeof(trace_bytes));
  out->append(" span_id=");
  AppendHex(out, span_bytes, sizeof(span_bytes));
}
#else
void AppendTraceContext(std::string*) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.3f}", value)};
}

void InitializeLogging(const depgraph::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }

  const auto level_name = EnvOr("DEPGRAPH_LOG_LEVEL", logging.level(), "info");
  bool       recognized = true;
  const auto level      = ParseLevel(level_name, &recognized);

  logger->set_pattern(EnvOr("DEPGRAPH_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  if (auto include_trace = Env("DEPGRAPH_LOG_INCLUDE_TRACE_CONTEXT")) {
    g_include_trace_context = *include_trace == "1" || *include_trace == "true";
  } else {
    g_include_trace_context = logging.include_trace_context();
  }

  if (!recognized) {
    Log(spdlog::level::warn, "unknown log level, using info", {StringField("level", level_name)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string line(message);
  for (const auto& field : fields) {
    line.push_back(' ');
    line.append(field.key);
    line.push_back('=');
    AppendValue(&line, field.value);
  }
  AppendTraceContext(&line);

  spdlog::log(level, "{}", line);
}

} // namespace depgraph::observability
