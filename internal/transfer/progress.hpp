#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace chunkvault::transfer {

struct ProgressSnapshot {
  uint64_t bytes_done   = 0;
  uint64_t bytes_total  = 0;
  uint32_t chunks_done  = 0;
  uint32_t chunks_total = 0;
};

using ProgressCallback = std::function<void(const ProgressSnapshot&)>;

/*
  Byte accounting for one transfer.

  Bytes are tracked per chunk ordinal so a retried chunk restarts from zero
  instead of being counted twice. Callbacks are serialized; byte-level
  updates are throttled, chunk completions always report.
*/
class ProgressTracker {
 public:
  ProgressTracker(uint64_t bytes_total, uint32_t chunks_total, ProgressCallback callback,
                  std::chrono::milliseconds min_interval = std::chrono::milliseconds{200});

  void SetChunkBytes(uint64_t ordinal, uint64_t bytes);

  void CompleteChunk(uint64_t ordinal, uint64_t bytes);

  ProgressSnapshot Snapshot() const;

 private:
  void SetLocked(uint64_t ordinal, uint64_t bytes);
  void ReportLocked(bool force);

  mutable std::mutex mutex_;

  std::vector<uint64_t> chunk_bytes_;
  std::vector<bool>     chunk_done_;
  ProgressSnapshot      snapshot_;
  ProgressCallback      callback_;

  std::chrono::milliseconds             min_interval_;
  std::chrono::steady_clock::time_point last_report_{};
};

} // namespace chunkvault::transfer
