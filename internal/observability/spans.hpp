#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace relay::runtime::config {
class RuntimeConfig;
}

namespace relay::observability {

/*
  Tracing and metrics for the relay, exported over OTLP.

  Built without ENABLE_OTEL every function below is an inline no-op, so
  call sites never carry their own #ifdef.
*/

bool InitializeTracing(const relay::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const relay::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// Active span for one RPC or one gateway connection. A non-empty device_id
// is attached as relay.device_id.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name, std::string_view device_id = {});
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // kind is "frame", "audio" or "location"
  void RecordFramesDropped(std::string_view kind, std::uint64_t count);
  void RecordCommandTransition(std::string_view status);
  void SetActiveSessions(std::string_view role, std::int64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const relay::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const relay::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view, std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
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

inline void Metrics::RecordFramesDropped(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordCommandTransition(std::string_view) {
}

inline void Metrics::SetActiveSessions(std::string_view, std::int64_t) {
}
#endif

} // namespace relay::observability
