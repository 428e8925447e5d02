#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/meter_provider_factory.h>
#include <opentelemetry/sdk/metrics/view/view_registry_factory.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_settings.hpp"

namespace depgraph::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

using MetricsConfig = depgraph::runtime::config::ObservabilityConfig::MetricsConfig;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// instrument groups toggled from config, read on every record call
struct Toggles {
  std::atomic<bool> requests{true};
  std::atomic<bool> latency{true};
  std::atomic<bool> routes{true};
  std::atomic<bool> publishes{true};
  std::atomic<bool> cache{true};
  std::atomic<bool> graph_size{true};
};

Toggles g_toggles;

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpSettings& settings) {
  if (settings.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

sdkmetrics::PeriodicExportingMetricReaderOptions ReaderOptions(const MetricsConfig& metrics) {
  sdkmetrics::PeriodicExportingMetricReaderOptions options;
  const std::uint32_t interval_ms = metrics.collection_interval_ms() > 0 ? metrics.collection_interval_ms() : 1000;
  options.export_interval_millis  = std::chrono::milliseconds(std::max(metrics.min_collection_interval_ms(), interval_ms));
  if (metrics.export_timeout_ms() > 0) {
    options.export_timeout_millis = std::chrono::milliseconds(metrics.export_timeout_ms());
  }
  return options;
}

void ApplyToggles(const MetricsConfig& metrics) {
  g_toggles.requests.store(metrics.request_metrics_enabled(), std::memory_order_relaxed);
  g_toggles.latency.store(metrics.request_latency_histograms_enabled(), std::memory_order_relaxed);
  g_toggles.routes.store(metrics.route_labels_enabled(), std::memory_order_relaxed);
  g_toggles.publishes.store(metrics.publish_metrics_enabled(), std::memory_order_relaxed);
  g_toggles.cache.store(metrics.cache_metrics_enabled(), std::memory_order_relaxed);
  g_toggles.graph_size.store(metrics.graph_size_metrics_enabled(), std::memory_order_relaxed);
}

bool Enabled(const std::atomic<bool>& toggle) {
  return toggle.load(std::memory_order_relaxed);
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      publish_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> cache_lookups;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   graph_size_gauge;

  // read by the gauge callback on the exporter thread
  std::atomic<std::int64_t> nodes{0};
  std::atomic<std::int64_t> edges{0};
  std::atomic<std::int64_t> contracts{0};
};

bool InitializeMetrics(const depgraph::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto settings = ResolveOtlpSettings(observability, OtlpSignal::kMetrics);
  auto       reader   = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(settings), ReaderOptions(observability.metrics()));

  g_provider = std::shared_ptr<sdkmetrics::MeterProvider>(sdkmetrics::MeterProviderFactory::Create(sdkmetrics::ViewRegistryFactory::Create(), ServiceResource()));
  g_provider->AddMetricReader(std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  ApplyToggles(observability.metrics());
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter(kServiceName, kServiceVersion);

  impl_->request_count       = impl_->meter->CreateUInt64Counter("depgraph.request.count", "1", "Total number of service requests");
  impl_->request_latency_ms  = impl_->meter->CreateDoubleHistogram("depgraph.request.latency_ms", "ms", "End-to-end request latency in milliseconds");
  impl_->publish_duration_ms = impl_->meter->CreateDoubleHistogram("depgraph.publish.duration_ms", "ms", "Publish duration by outcome in milliseconds");
  impl_->cache_lookups       = impl_->meter->CreateUInt64Counter("depgraph.cache.lookups", "1", "Result cache lookups by query kind and outcome");
  impl_->graph_size_gauge    = impl_->meter->CreateInt64ObservableGauge("depgraph.graph.size", "Size of the current graph snapshot", "1");
  impl_->graph_size_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);

        const std::initializer_list<AttributePair> nodes     = {{"element", "nodes"}};
        const std::initializer_list<AttributePair> edges     = {{"element", "edges"}};
        const std::initializer_list<AttributePair> contracts = {{"element", "contracts"}};
        int_result->Observe(impl->nodes.load(std::memory_order_relaxed), nodes);
        int_result->Observe(impl->edges.load(std::memory_order_relaxed), edges);
        int_result->Observe(impl->contracts.load(std::memory_order_relaxed), contracts);
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count || !Enabled(g_toggles.requests)) {
    return;
  }

  if (Enabled(g_toggles.routes)) {
    const std::string                          route_label(route);
    const std::initializer_list<AttributePair> attributes = {{"route", route_label}, {"success", success}};
    impl_->request_count->Add(static_cast<std::uint64_t>(1), attributes);
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"success", success}};
  impl_->request_count->Add(static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms || !Enabled(g_toggles.requests) || !Enabled(g_toggles.latency)) {
    return;
  }

  if (Enabled(g_toggles.routes)) {
    const std::string                          route_label(route);
    const std::initializer_list<AttributePair> attributes = {{"route", route_label}};
    impl_->request_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
    return;
  }

  impl_->request_latency_ms->Record(latency_ms, opentelemetry::context::Context{});
}

void Metrics::ObservePublishDurationMs(std::string_view outcome, double duration_ms) {
  if (!impl_ || !impl_->publish_duration_ms || !Enabled(g_toggles.publishes)) {
    return;
  }

  const std::string                          outcome_label(outcome);
  const std::initializer_list<AttributePair> attributes = {{"outcome", outcome_label}};
  impl_->publish_duration_ms->Record(duration_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordCacheLookup(std::string_view query_kind, bool hit) {
  if (!impl_ || !impl_->cache_lookups || !Enabled(g_toggles.cache)) {
    return;
  }

  const std::string                          query_label(query_kind);
  const std::initializer_list<AttributePair> attributes = {{"query", query_label}, {"hit", hit}};
  impl_->cache_lookups->Add(static_cast<std::uint64_t>(1), attributes);
}

void Metrics::SetGraphSize(std::uint64_t nodes, std::uint64_t edges, std::uint64_t contracts) {
  if (!impl_ || !impl_->graph_size_gauge || !Enabled(g_toggles.graph_size)) {
    return;
  }

  impl_->nodes.store(static_cast<std::int64_t>(nodes), std::memory_order_relaxed);
  impl_->edges.store(static_cast<std::int64_t>(edges), std::memory_order_relaxed);
  impl_->contracts.store(static_cast<std::int64_t>(contracts), std::memory_order_relaxed);
}

} // namespace depgraph::observability

#endif
