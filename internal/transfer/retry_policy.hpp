#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/transfer/cancellation.hpp"
#include "internal/util/errors.hpp"

namespace chunkvault::runtime::config {
class RetryConfig;
}

namespace chunkvault::transfer {

struct RetryPolicy {
  uint32_t max_attempts = 3;

  std::chrono::milliseconds initial_backoff{500};
  std::chrono::milliseconds max_backoff{8000};

  double multiplier = 2.0;

  // Delay after failed attempt number `attempt` (1-based).
  std::chrono::milliseconds BackoffAfter(uint32_t attempt) const;

  static RetryPolicy FromConfig(const chunkvault::runtime::config::RetryConfig& config);
};

/*
  Runs fn(attempt) until it returns, retrying retryable TransportErrors with
  exponential backoff.

  Exhausted retries and non-retryable transport failures become
  OperationFailed carrying `ordinal`. Cancelled passes through untouched, as
  does every other exception type.
*/
template <typename Fn>
auto WithRetry(const RetryPolicy& policy, const CancellationToken& cancel, const std::string& what,
               std::optional<uint64_t> ordinal, Fn&& fn) -> decltype(fn(uint32_t{1})) {
  const uint32_t max_attempts = policy.max_attempts == 0 ? 1 : policy.max_attempts;

  for (uint32_t attempt = 1;; ++attempt) {
    cancel.ThrowIfCancelled(what);
    try {
      return fn(attempt);
    } catch (const util::TransportError& e) {
      if (cancel.IsCancelled()) {
        throw util::Cancelled(what + " cancelled");
      }
      if (!e.retryable() || attempt >= max_attempts) {
        throw util::OperationFailed(what + " failed after " + std::to_string(attempt) + " attempt(s): " + e.what(), ordinal);
      }

      const auto delay = policy.BackoffAfter(attempt);
      CHUNKVAULT_LOG_WARN("Retrying transfer", {observability::StringField("operation", what), observability::IntField("attempt", attempt),
                                                observability::IntField("backoff_ms", delay.count()),
                                                observability::StringField("error", e.what())});
      if (cancel.WaitFor(delay)) {
        throw util::Cancelled(what + " cancelled");
      }
    }
  }
}

} // namespace chunkvault::transfer
