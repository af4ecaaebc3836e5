#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace ledger::observability {

/*
  Wraps one public operation: span, success/failure counter, latency
  histogram and a single log line on failure. Exceptions are rethrown
  unchanged.
*/
template <typename Fn>
auto ObserveOperation(std::string_view op, std::string_view stream_id, Fn&& fn) {
  SpanScope span(op);
  if (!stream_id.empty()) {
    span.SetAttribute("stream.id", stream_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool success) {
    Metrics::Instance().RecordOperation(op, success);
    Metrics::Instance().ObserveOperationLatencyMs(
        op, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
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
  } catch (const util::VersionConflict& ex) {
    // expected under contention; callers rehydrate and retry
    span.RecordException(ex.what());
    Metrics::Instance().RecordVersionConflict(ex.StreamId());
    LEDGER_LOG_DEBUG("version conflict", {StringField("op", op), StringField("stream", stream_id), UintField("expected", ex.Expected()),
                                          UintField("actual", ex.Actual())});
    finish(false);
    throw;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    LEDGER_LOG_ERROR("operation failed", {StringField("op", op), StringField("stream", stream_id), StringField("error", ex.what())});
    finish(false);
    throw;
  }
}

} // namespace ledger::observability
