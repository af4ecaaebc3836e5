#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ledger::util {

/*
  Bounded exponential backoff for storage round-trips.

  Only StorageFailure is retried. Version conflicts, duplicate ids and
  validation errors pass through on the first attempt.
*/
struct RetryPolicy {
  uint32_t                  max_attempts    = 5;
  std::chrono::milliseconds initial_backoff = std::chrono::milliseconds(10);
  std::chrono::milliseconds max_backoff     = std::chrono::milliseconds(1000);
};

inline std::chrono::milliseconds BackoffFor(const RetryPolicy& policy, uint32_t attempt) {
  auto delay = policy.initial_backoff;
  for (uint32_t i = 1; i < attempt && delay < policy.max_backoff; ++i) {
    delay *= 2;
  }
  return std::min(delay, policy.max_backoff);
}

template <typename Fn>
auto WithStorageRetry(const RetryPolicy& policy, std::string_view op, Fn&& fn) -> decltype(fn()) {
  const uint32_t attempts = std::max<uint32_t>(policy.max_attempts, 1);
  for (uint32_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const StorageFailure& e) {
      if (attempt >= attempts) {
        LEDGER_LOG_ERROR("storage retries exhausted", {observability::StringField("op", op), observability::IntField("attempts", attempt),
                                                       observability::StringField("error", e.what())});
        throw StorageFailure(std::string(op) + ": " + e.what());
      }

      const auto delay = BackoffFor(policy, attempt);
      LEDGER_LOG_WARN("storage operation failed; retrying",
                      {observability::StringField("op", op), observability::IntField("attempt", attempt),
                       observability::IntField("backoff_ms", delay.count()), observability::StringField("error", e.what())});
      std::this_thread::sleep_for(delay);
    }
  }
}

} // namespace ledger::util
