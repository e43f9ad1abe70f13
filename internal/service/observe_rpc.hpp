#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/auth/identity.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace dispatch::service {

/*
  Wraps one RPC body with a span, the request counter and latency
  histogram, and an error log. Exceptions propagate unchanged.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, const auth::Identity* caller, Fn&& fn) {
  dispatch::observability::SpanScope span(route);
  if (caller) {
    span.SetAttribute("identity", caller->id);
    span.SetAttribute("role", auth::ToString(caller->role));
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      dispatch::observability::Metrics::Instance().RecordRequest(route, true);
      dispatch::observability::Metrics::Instance().ObserveRequestLatencyMs(
          route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
      return;
    } else {
      auto result = fn();
      dispatch::observability::Metrics::Instance().RecordRequest(route, true);
      dispatch::observability::Metrics::Instance().ObserveRequestLatencyMs(
          route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    DISPATCH_LOG_ERROR("RPC failed", {dispatch::observability::StringField("route", route), dispatch::observability::StringField("error", ex.what()),
                                      dispatch::observability::StringField("identity", caller ? caller->id : "")});
    dispatch::observability::Metrics::Instance().RecordRequest(route, false);
    dispatch::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

} // namespace dispatch::service
