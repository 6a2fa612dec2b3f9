#include "internal/observability/otlp.hpp"

#ifdef ENABLE_OTEL

#include <cstdlib>

namespace relay::observability::otlp_support {

namespace {

const char* SignalVariable(Signal signal) {
  return signal == Signal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
}

std::string DefaultAddress(Signal signal, bool http) {
  if (!http) return "localhost:4317";
  return signal == Signal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

} // namespace

Endpoint ResolveEndpoint(const relay::runtime::config::ObservabilityConfig& config, Signal signal) {
  Endpoint out;
  out.http = config.transport() == relay::runtime::config::OTLP_TRANSPORT_HTTP;

  if (!config.otlp_endpoint().empty()) {
    out.address = config.otlp_endpoint();
  } else if (const char* value = std::getenv(SignalVariable(signal))) {
    out.address = value;
  } else if (const char* value = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    out.address = value;
  } else {
    out.address = DefaultAddress(signal, out.http);
  }

  out.insecure = out.address.rfind("https://", 0) != 0;
  return out;
}

opentelemetry::sdk::resource::Resource RelayResource() {
  return opentelemetry::sdk::resource::Resource::Create({{"service.name", kServiceName}, {"service.version", kServiceVersion}});
}

} // namespace relay::observability::otlp_support

#endif
