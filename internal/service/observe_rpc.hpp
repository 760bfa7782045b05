#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace ridedispatch::service {

// Span, request metrics and an error log around one RPC body. Rethrows.
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool ok) {
    observability::Metrics::Instance().RecordRequest(route, ok);
    observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    RIDEDISPATCH_LOG_ERROR("RPC failed",
                           {observability::StringField("route", route), observability::StringField("error", ex.what())});
    finish(false);
    throw;
  }
}

} // namespace ridedispatch::service
