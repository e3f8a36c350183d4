#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/error_kind.hpp"
#include "operation_result.hpp"

namespace datarouter::service::detail {

/*
  Runs fn inside a span, records request count and latency, and turns any
  exception into a failed OperationResult.
*/
template <typename Fn>
auto Observe(std::string_view route, Fn&& fn) -> OperationResult<std::decay_t<std::invoke_result_t<Fn>>> {
  using Value = std::decay_t<std::invoke_result_t<Fn>>;

  observability::SpanScope span(route, observability::SpanKind::kServer);
  auto&                    metrics    = observability::Metrics::Instance();
  const auto               started_at = std::chrono::steady_clock::now();
  const auto               elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    auto value = fn();
    metrics.RecordRequest(route, true);
    metrics.ObserveRequestLatencyMs(route, elapsed_ms());
    return OperationResult<Value>::Ok(std::move(value));
  } catch (const std::exception& ex) {
    const auto kind = util::KindOf(ex);
    span.RecordException(ex.what());
    DATAROUTER_LOG_ERROR("Operation failed", {observability::StringField("route", route), observability::StringField("kind", util::ToString(kind)),
                                              observability::StringField("error", ex.what())});
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, elapsed_ms());
    return OperationResult<Value>::Fail(kind, ex.what());
  }
}

} // namespace datarouter::service::detail
