#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

#include "internal/util/errors.hpp"

namespace chunkvault::transfer {

/*
  Cooperative cancellation shared by every chunk operation of one transfer.

  The first failing chunk cancels its siblings through this token; in-flight
  HTTP requests poll it from their progress callback and backoff sleeps wake
  up on it.
*/
class CancellationToken {
 public:
  void Cancel() {
    {
      std::lock_guard lock(mutex_);
      cancelled_ = true;
    }
    cv_.notify_all();
  }

  bool IsCancelled() const {
    return cancelled_.load();
  }

  // Sleeps up to `duration`. Returns true if cancelled meanwhile.
  bool WaitFor(std::chrono::milliseconds duration) const {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
  }

  void ThrowIfCancelled(const std::string& what) const {
    if (IsCancelled()) {
      throw util::Cancelled(what + " cancelled");
    }
  }

 private:
  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  std::atomic<bool>               cancelled_{false};
};

} // namespace chunkvault::transfer
