#include "progress.hpp"

namespace chunkvault::transfer {

ProgressTracker::ProgressTracker(uint64_t bytes_total, uint32_t chunks_total, ProgressCallback callback,
                                 std::chrono::milliseconds min_interval)
    : chunk_bytes_(chunks_total, 0), chunk_done_(chunks_total, false), callback_(std::move(callback)), min_interval_(min_interval) {
  snapshot_.bytes_total  = bytes_total;
  snapshot_.chunks_total = chunks_total;
}

void ProgressTracker::SetLocked(uint64_t ordinal, uint64_t bytes) {
  if (ordinal >= chunk_bytes_.size()) {
    chunk_bytes_.resize(ordinal + 1, 0);
    chunk_done_.resize(ordinal + 1, false);
  }
  snapshot_.bytes_done = snapshot_.bytes_done - chunk_bytes_[ordinal] + bytes;
  chunk_bytes_[ordinal] = bytes;
}

void ProgressTracker::SetChunkBytes(uint64_t ordinal, uint64_t bytes) {
  std::lock_guard lock(mutex_);
  if (ordinal < chunk_done_.size() && chunk_done_[ordinal]) {
    return;
  }
  SetLocked(ordinal, bytes);
  ReportLocked(false);
}

void ProgressTracker::CompleteChunk(uint64_t ordinal, uint64_t bytes) {
  std::lock_guard lock(mutex_);
  if (ordinal < chunk_done_.size() && chunk_done_[ordinal]) {
    return;
  }
  SetLocked(ordinal, bytes);
  chunk_done_[ordinal] = true;
  ++snapshot_.chunks_done;
  ReportLocked(true);
}

ProgressSnapshot ProgressTracker::Snapshot() const {
  std::lock_guard lock(mutex_);
  return snapshot_;
}

void ProgressTracker::ReportLocked(bool force) {
  if (!callback_) {
    return;
  }
  const auto now = std::chrono::steady_clock::now();
  if (!force && now - last_report_ < min_interval_) {
    return;
  }
  last_report_ = now;
  callback_(snapshot_);
}

} // namespace chunkvault::transfer
