#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace relay::service {

/*
  Wraps one RPC body with a span, request count/latency metrics and an
  error log line. Exceptions are rethrown for the adapter to translate.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view device_id, Fn&& fn) {
  relay::observability::SpanScope span(route, device_id);

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    relay::observability::Metrics::Instance().RecordRequest(route, success);
    relay::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      std::forward<Fn>(fn)();
      finish(true);
      return;
    } else {
      auto result = std::forward<Fn>(fn)();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    RELAY_LOG_ERROR("RPC failed", {relay::observability::StringField("route", route), relay::observability::StringField("error", ex.what()),
                                   relay::observability::DeviceField(device_id)});
    finish(false);
    throw;
  }
}

} // namespace relay::service
