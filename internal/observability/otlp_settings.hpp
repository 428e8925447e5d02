#pragma once

#include <string>

#include <opentelemetry/sdk/resource/resource.h>

namespace depgraph::runtime::config {
class ObservabilityConfig;
}

namespace depgraph::observability {

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

struct OtlpSettings {
  std::string endpoint;
  bool        http     = false;
  bool        insecure = true;
};

/*
  Export target for one signal. Endpoint precedence:
    observability.otlp_endpoint
    OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT
    OTEL_EXPORTER_OTLP_ENDPOINT
    local collector default for the transport
*/
OtlpSettings ResolveOtlpSettings(const depgraph::runtime::config::ObservabilityConfig& config, OtlpSignal signal);

// service.name / service.version shared by the tracer and meter providers.
opentelemetry::sdk::resource::Resource ServiceResource();

} // namespace depgraph::observability
