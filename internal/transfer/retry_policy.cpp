#include "retry_policy.hpp"

#include <algorithm>
#include <cmath>

#include "config/config.pb.h"

namespace chunkvault::transfer {

std::chrono::milliseconds RetryPolicy::BackoffAfter(uint32_t attempt) const {
  if (attempt == 0) {
    return std::chrono::milliseconds{0};
  }
  const double scaled = static_cast<double>(initial_backoff.count()) * std::pow(multiplier, static_cast<double>(attempt - 1));
  const double capped = std::min(scaled, static_cast<double>(max_backoff.count()));
  return std::chrono::milliseconds{static_cast<int64_t>(capped)};
}

RetryPolicy RetryPolicy::FromConfig(const chunkvault::runtime::config::RetryConfig& config) {
  RetryPolicy policy;
  policy.max_attempts    = config.max_attempts();
  policy.initial_backoff = std::chrono::milliseconds{config.initial_backoff_ms()};
  policy.max_backoff     = std::chrono::milliseconds{config.max_backoff_ms()};
  policy.multiplier      = config.backoff_multiplier() > 0.0 ? config.backoff_multiplier() : 2.0;
  return policy;
}

} // namespace chunkvault::transfer
