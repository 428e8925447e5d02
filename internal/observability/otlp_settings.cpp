#ifdef ENABLE_OTEL

#include "internal/observability/otlp_settings.hpp"

#include <cstdlib>
#include <string>

#include "config/config.pb.h"
#include "internal/observability/spans.hpp"

namespace depgraph::observability {

namespace resource = opentelemetry::sdk::resource;

namespace {

const char* SignalEnv(OtlpSignal signal) {
  return signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
}

const char* DefaultEndpoint(OtlpSignal signal, bool http) {
  if (!http) {
    return "localhost:4317";
  }
  return signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

} // namespace

OtlpSettings ResolveOtlpSettings(const depgraph::runtime::config::ObservabilityConfig& config, OtlpSignal signal) {
  OtlpSettings settings;
  settings.http = config.transport() == depgraph::runtime::config::OTLP_TRANSPORT_HTTP;

  if (!config.otlp_endpoint().empty()) {
    settings.endpoint = config.otlp_endpoint();
  } else if (const char* endpoint = std::getenv(SignalEnv(signal)); endpoint && *endpoint) {
    settings.endpoint = endpoint;
  } else if (const char* shared = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT"); shared && *shared) {
    settings.endpoint = shared;
  } else {
    settings.endpoint = DefaultEndpoint(signal, settings.http);
  }

  // plaintext unless the endpoint asks for TLS
  settings.insecure = settings.endpoint.rfind("https://", 0) != 0;
  return settings;
}

resource::Resource ServiceResource() {
  resource::ResourceAttributes attrs = {{"service.name", std::string(kServiceName)}, {"service.version", std::string(kServiceVersion)}};
  return resource::Resource::Create(attrs);
}

} // namespace depgraph::observability

#endif
