#include "internal/transfer/retry_policy.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/transfer/progress.hpp"
#include "internal/util/errors.hpp"

namespace {

using chunkvault::transfer::CancellationToken;
using chunkvault::transfer::ProgressSnapshot;
using chunkvault::transfer::ProgressTracker;
using chunkvault::transfer::RetryPolicy;
using chunkvault::transfer::WithRetry;

RetryPolicy FastPolicy(uint32_t attempts) {
  RetryPolicy policy;
  policy.max_attempts    = attempts;
  policy.initial_backoff = std::chrono::milliseconds{1};
  policy.max_backoff     = std::chrono::milliseconds{4};
  return policy;
}

void TestBackoffGrowsAndCaps() {
  chunkvault::runtime::config::RetryConfig config;
  config.set_max_attempts(5);
  config.set_initial_backoff_ms(500);
  config.set_max_backoff_ms(1500);
  config.set_backoff_multiplier(2.0);

  const auto policy = RetryPolicy::FromConfig(config);
  assert(policy.max_attempts == 5);
  assert(policy.BackoffAfter(1) == std::chrono::milliseconds{500});
  assert(policy.BackoffAfter(2) == std::chrono::milliseconds{1000});
  assert(policy.BackoffAfter(3) == std::chrono::milliseconds{1500});
  assert(policy.BackoffAfter(10) == std::chrono::milliseconds{1500});
}

void TestRetrySucceedsAfterTransientErrors() {
  CancellationToken cancel;
  int               calls = 0;

  const int value = WithRetry(FastPolicy(3), cancel, "op", 4, [&](uint32_t attempt) {
    ++calls;
    assert(attempt == static_cast<uint32_t>(calls));
    if (calls < 3) throw chunkvault::util::TransportError("busy", 429, true);
    return 7;
  });

  assert(value == 7);
  assert(calls == 3);
}

void TestExhaustedRetriesBecomeOperationFailed() {
  CancellationToken cancel;
  int               calls = 0;

  bool threw = false;
  try {
    WithRetry(FastPolicy(2), cancel, "upload of chunk 4", 4, [&](uint32_t) -> int {
      ++calls;
      throw chunkvault::util::TransportError("HTTP 503", 503, true);
    });
  } catch (const chunkvault::util::OperationFailed& e) {
    threw = true;
    assert(*e.ordinal() == 4);
    assert(std::string(e.what()).find("HTTP 503") != std::string::npos);
  }
  assert(threw);
  assert(calls == 2);
}

void TestOtherErrorsPassThrough() {
  CancellationToken cancel;

  bool threw = false;
  try {
    WithRetry(FastPolicy(3), cancel, "op", std::nullopt, [](uint32_t) -> int { throw chunkvault::util::LocalIOError("disk full"); });
  } catch (const chunkvault::util::LocalIOError&) {
    threw = true;
  }
  assert(threw);
}

void TestCancelInterruptsBackoff() {
  CancellationToken cancel;
  RetryPolicy       slow = FastPolicy(5);
  slow.initial_backoff   = std::chrono::milliseconds{10'000};
  slow.max_backoff       = std::chrono::milliseconds{10'000};

  std::thread canceller([&cancel] {
    std::this_thread::sleep_for(std::chrono::milliseconds{50});
    cancel.Cancel();
  });

  const auto started = std::chrono::steady_clock::now();
  bool       threw   = false;
  try {
    WithRetry(slow, cancel, "op", 0, [](uint32_t) -> int { throw chunkvault::util::TransportError("timeout", 0, true); });
  } catch (const chunkvault::util::Cancelled&) {
    threw = true;
  }
  canceller.join();

  assert(threw);
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds{5});
}

void TestProgressCountsRetriedChunkOnce() {
  std::vector<ProgressSnapshot> seen;
  ProgressTracker               tracker(30, 3, [&seen](const ProgressSnapshot& s) { seen.push_back(s); }, std::chrono::milliseconds{0});

  tracker.SetChunkBytes(0, 6);
  tracker.SetChunkBytes(0, 0);  // retry restarts the chunk
  tracker.SetChunkBytes(0, 9);
  tracker.CompleteChunk(0, 10);
  tracker.CompleteChunk(0, 10);
  tracker.CompleteChunk(1, 10);

  const auto snapshot = tracker.Snapshot();
  assert(snapshot.bytes_done == 20);
  assert(snapshot.chunks_done == 2);
  assert(snapshot.bytes_total == 30);
  assert(seen.back().bytes_done == 20);
}

} // namespace

int main() {
  TestBackoffGrowsAndCaps();
  TestRetrySucceedsAfterTransientErrors();
  TestExhaustedRetriesBecomeOperationFailed();
  TestOtherErrorsPassThrough();
  TestCancelInterruptsBackoff();
  TestProgressCountsRetriedChunkOnce();

  std::cout << "chunkvault_unit_retry_policy: pass\n";
  return 0;
}
