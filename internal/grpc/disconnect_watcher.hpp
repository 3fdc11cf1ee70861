#pragma once

#include <chrono>
#include <functional>
#include <thread>
#include <utility>

#include "internal/transfer/cancellation.hpp"

namespace chunkvault::grpc {

/*
  Polls `disconnected` until destroyed and cancels `cancel` the first time it
  reports true. Covers stretches where a transfer writes no events, such as a
  stalled chunk request.
*/
class DisconnectWatcher {
 public:
  DisconnectWatcher(std::function<bool()> disconnected, transfer::CancellationToken& cancel,
                    std::chrono::milliseconds interval = std::chrono::milliseconds{100})
      : disconnected_(std::move(disconnected)), cancel_(cancel), interval_(interval), thread_([this] { Run(); }) {
  }

  ~DisconnectWatcher() {
    stop_.Cancel();
    thread_.join();
  }

  DisconnectWatcher(const DisconnectWatcher&)            = delete;
  DisconnectWatcher& operator=(const DisconnectWatcher&) = delete;

 private:
  void Run() {
    while (!stop_.WaitFor(interval_)) {
      if (disconnected_()) {
        cancel_.Cancel();
        return;
      }
    }
  }

  std::function<bool()>        disconnected_;
  transfer::CancellationToken& cancel_;
  std::chrono::milliseconds    interval_;
  transfer::CancellationToken  stop_;
  std::thread                  thread_;
};

} // namespace chunkvault::grpc
