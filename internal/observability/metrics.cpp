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
#include <opentelemetry/sdk/metrics/view/view_registry.h>

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace relay::observability {

namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

using relay::runtime::config::ObservabilityConfig;

namespace {

using Attributes = std::initializer_list<std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>>;

constexpr auto kDefaultCollectionInterval = std::chrono::milliseconds(1000);

// Which instrument families report. A config without a metrics block keeps
// all of them on.
struct Toggles {
  bool requests     = true;
  bool latency      = true;
  bool route_labels = true;
  bool sessions     = true;
  bool media        = true;
  bool commands     = true;
};

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;
Toggles                                    g_toggles;

Toggles TogglesFrom(const ObservabilityConfig& config) {
  Toggles toggles;
  if (!config.has_metrics()) {
    return toggles;
  }
  const auto& metrics  = config.metrics();
  toggles.requests     = metrics.request_metrics_enabled();
  toggles.latency      = metrics.request_latency_histograms_enabled();
  toggles.route_labels = metrics.route_labels_enabled();
  toggles.sessions     = metrics.session_metrics_enabled();
  toggles.media        = metrics.media_metrics_enabled();
  toggles.commands     = metrics.command_metrics_enabled();
  return toggles;
}

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const ObservabilityConfig& config) {
  const auto endpoint = otlp_support::ResolveEndpoint(config, otlp_support::Signal::kMetrics);
  if (endpoint.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint.address;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint.address;
  options.use_ssl_credentials = !endpoint.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

sdkmetrics::PeriodicExportingMetricReaderOptions ReaderOptions(const ObservabilityConfig::MetricsConfig& config) {
  sdkmetrics::PeriodicExportingMetricReaderOptions options;

  auto interval = config.collection_interval_ms() > 0 ? std::chrono::milliseconds(config.collection_interval_ms()) : kDefaultCollectionInterval;
  interval      = std::max(interval, std::chrono::milliseconds(config.min_collection_interval_ms()));
  options.export_interval_millis = interval;

  if (config.export_timeout_ms() > 0) {
    options.export_timeout_millis = std::chrono::milliseconds(config.export_timeout_ms());
  }
  return options;
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> requests;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> frames_dropped;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> command_transitions;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   active_sessions;

  // role -> live session count, read by the gauge callback
  std::mutex                          sessions_mutex;
  std::map<std::string, std::int64_t> sessions_by_role;
};

bool InitializeMetrics(const relay::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(observability), ReaderOptions(observability.metrics()));

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), otlp_support::RelayResource());
  g_provider->AddMetricReader(std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  g_toggles = TogglesFrom(observability);
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

// Instance() is first touched after InitializeMetrics, so the meter comes
// from the configured provider (or the global no-op one).
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter(otlp_support::kServiceName, otlp_support::kServiceVersion);

  impl_->requests            = impl_->meter->CreateUInt64Counter("relay.request.count", "Pairing and device API calls", "1");
  impl_->request_latency_ms  = impl_->meter->CreateDoubleHistogram("relay.request.latency_ms", "Pairing and device API latency", "ms");
  impl_->frames_dropped      = impl_->meter->CreateUInt64Counter("relay.media.frames_dropped", "Media messages lost to slow or closed controllers", "1");
  impl_->command_transitions = impl_->meter->CreateUInt64Counter("relay.command.transitions", "Command status changes", "1");
  impl_->active_sessions     = impl_->meter->CreateInt64ObservableGauge("relay.sessions.active", "Live gateway sessions by role", "1");

  impl_->active_sessions->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl     = static_cast<Impl*>(state);
        auto  observer = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);

        std::lock_guard lock(impl->sessions_mutex);
        for (const auto& [role, count] : impl->sessions_by_role) {
          observer->Observe(count, Attributes{{"role", opentelemetry::nostd::string_view(role)}});
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!g_toggles.requests) {
    return;
  }

  const opentelemetry::context::Context context;
  if (g_toggles.route_labels) {
    impl_->requests->Add(1, Attributes{{"route", opentelemetry::nostd::string_view(route.data(), route.size())}, {"success", success}}, context);
  } else {
    impl_->requests->Add(1, Attributes{{"success", success}}, context);
  }
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!g_toggles.requests || !g_toggles.latency) {
    return;
  }

  const opentelemetry::context::Context context;
  if (g_toggles.route_labels) {
    impl_->request_latency_ms->Record(latency_ms, Attributes{{"route", opentelemetry::nostd::string_view(route.data(), route.size())}}, context);
  } else {
    impl_->request_latency_ms->Record(latency_ms, Attributes{}, context);
  }
}

void Metrics::RecordFramesDropped(std::string_view kind, std::uint64_t count) {
  if (!g_toggles.media || count == 0) {
    return;
  }
  impl_->frames_dropped->Add(count, Attributes{{"kind", opentelemetry::nostd::string_view(kind.data(), kind.size())}},
                             opentelemetry::context::Context{});
}

void Metrics::RecordCommandTransition(std::string_view status) {
  if (!g_toggles.commands) {
    return;
  }
  impl_->command_transitions->Add(1, Attributes{{"status", opentelemetry::nostd::string_view(status.data(), status.size())}},
                                  opentelemetry::context::Context{});
}

void Metrics::SetActiveSessions(std::string_view role, std::int64_t count) {
  if (!g_toggles.sessions) {
    return;
  }

  std::lock_guard lock(impl_->sessions_mutex);
  impl_->sessions_by_role[std::string(role)] = count;
}

} // namespace relay::observability

#endif
