#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace projsync::service {

// Span, request metrics and failure logging around one service call.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::optional<int64_t> key, Fn&& fn) {
  projsync::observability::SpanScope span(route);
  if (key) {
    span.SetAttribute(projsync::observability::attr::kKey, static_cast<std::int64_t>(*key));
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      projsync::observability::Metrics::Instance().RecordRequest(route, true);
      projsync::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      projsync::observability::Metrics::Instance().RecordRequest(route, true);
      projsync::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    PROJSYNC_LOG_ERROR("RPC failed", {projsync::observability::StringField("route", route), projsync::observability::StringField("error", ex.what()),
                                      projsync::observability::IntField("key", key.value_or(0))});
    projsync::observability::Metrics::Instance().RecordRequest(route, false);
    projsync::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace projsync::service
