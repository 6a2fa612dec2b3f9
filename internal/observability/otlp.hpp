#pragma once

#ifdef ENABLE_OTEL

#include <string>

#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace relay::observability::otlp_support {

inline constexpr const char* kServiceName    = "remoteeye-relay";
inline constexpr const char* kServiceVersion = "0.1.0";

enum class Signal {
  kTraces,
  kMetrics,
};

struct Endpoint {
  std::string address;
  bool        http     = false;
  bool        insecure = true;
};

// Config endpoint first, then the per-signal and generic OTEL_* variables,
// then the collector default for the transport.
Endpoint ResolveEndpoint(const relay::runtime::config::ObservabilityConfig& config, Signal signal);

opentelemetry::sdk::resource::Resource RelayResource();

} // namespace relay::observability::otlp_support

#endif
