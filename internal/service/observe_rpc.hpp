#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace foreman::service {

/*
  Wraps one service call in a span plus request count / latency metrics.
  Failures are logged with the route and rethrown for the gRPC layer.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject_key, std::string_view subject, Fn&& fn) {
  foreman::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute(subject_key, subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool ok) {
    foreman::observability::Metrics::Instance().RecordRequest(route, ok);
    foreman::observability::Metrics::Instance().ObserveRequestLatencyMs(
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
    FOREMAN_LOG_ERROR("RPC failed", {foreman::observability::StringField("route", route), foreman::observability::StringField("error", ex.what()),
                                     foreman::observability::StringField(subject_key, subject)});
    finish(false);
    throw;
  }
}

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  return ObserveRpc(route, "subject", "", std::forward<Fn>(fn));
}

} // namespace foreman::service
