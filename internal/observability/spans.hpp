#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace depgraph::runtime::config {
class RuntimeConfig;
}

namespace depgraph::observability {

inline constexpr const char* kServiceName    = "depgraph";
inline constexpr const char* kServiceVersion = "0.1.0";

// Both return false when the signal is disabled in config.
bool InitializeTracing(const depgraph::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const depgraph::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// RAII span, active on the calling thread until destroyed. No-op without a
// tracer provider.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

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
  Process-wide instruments.

  publish outcome is one of: accepted, duplicate, cycle, malformed, error.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void ObservePublishDurationMs(std::string_view outcome, double duration_ms);
  void RecordCacheLookup(std::string_view query_kind, bool hit);
  void SetGraphSize(std::uint64_t nodes, std::uint64_t edges, std::uint64_t contracts);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const depgraph::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const depgraph::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::ObservePublishDurationMs(std::string_view, double) {
}

inline void Metrics::RecordCacheLookup(std::string_view, bool) {
}

inline void Metrics::SetGraphSize(std::uint64_t, std::uint64_t, std::uint64_t) {
}
#endif

} // namespace depgraph::observability
