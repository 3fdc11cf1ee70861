#include "id_allocator.hpp"

#include <iterator>
#include <string>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace chunkvault::registry {

namespace {

uint64_t CountInRange(const std::set<FileId>& existing, FileId min_id, FileId max_id) {
  auto first = existing.lower_bound(min_id);
  auto last  = existing.upper_bound(max_id);
  return static_cast<uint64_t>(std::distance(first, last));
}

bool SpaceIsFull(const std::set<FileId>& existing, FileId min_id, FileId max_id) {
  const uint64_t space = max_id - min_id;  // size - 1, avoids overflow on the full 64-bit range
  return CountInRange(existing, min_id, max_id) > space;
}

[[noreturn]] void ThrowExhausted(FileId min_id, FileId max_id) {
  throw util::ExhaustedIdSpace("no free file id in [" + std::to_string(min_id) + ", " + std::to_string(max_id) + "]");
}

// Lowest free id in [from, max_id], or 0.
FileId FirstFreeFrom(const std::set<FileId>& existing, FileId from, FileId max_id) {
  FileId candidate = from;
  for (auto it = existing.lower_bound(from); it != existing.end() && *it <= max_id; ++it) {
    if (*it != candidate) break;
    if (candidate == max_id) return 0;
    ++candidate;
  }
  return candidate;
}

void CheckRange(FileId min_id, FileId max_id) {
  if (min_id == 0 || min_id > max_id) {
    throw util::InvalidArgument("invalid file id range [" + std::to_string(min_id) + ", " + std::to_string(max_id) + "]");
  }
}

} // namespace

// ------------------------------------------------------------
// Random
// ------------------------------------------------------------

RandomIdAllocator::RandomIdAllocator(FileId min_id, FileId max_id, uint32_t max_attempts, uint64_t seed)
    : min_id_(min_id), max_id_(max_id), max_attempts_(max_attempts), rng_(seed) {
  CheckRange(min_id_, max_id_);
}

FileId RandomIdAllocator::Allocate(const std::set<FileId>& existing) {
  if (SpaceIsFull(existing, min_id_, max_id_)) {
    ThrowExhausted(min_id_, max_id_);
  }

  std::uniform_int_distribution<FileId> dist(min_id_, max_id_);

  for (uint32_t attempt = 0; attempt < max_attempts_; ++attempt) {
    const FileId candidate = dist(rng_);
    if (!existing.contains(candidate)) {
      return candidate;
    }
  }

  // Space is dense. Scan from a random point and wrap once.
  const FileId start = dist(rng_);
  if (FileId id = FirstFreeFrom(existing, start, max_id_); id != 0) {
    return id;
  }
  if (FileId id = FirstFreeFrom(existing, min_id_, max_id_); id != 0) {
    return id;
  }
  ThrowExhausted(min_id_, max_id_);
}

// ------------------------------------------------------------
// Sequential
// ------------------------------------------------------------

SequentialIdAllocator::SequentialIdAllocator(FileId min_id, FileId max_id) : min_id_(min_id), max_id_(max_id) {
  CheckRange(min_id_, max_id_);
}

FileId SequentialIdAllocator::Allocate(const std::set<FileId>& existing) {
  auto last = existing.upper_bound(max_id_);
  if (last != existing.begin()) {
    const FileId highest = *std::prev(last);
    if (highest >= min_id_ && highest < max_id_) {
      return highest + 1;
    }
  }
  if (FileId id = FirstFreeFrom(existing, min_id_, max_id_); id != 0) {
    return id;
  }
  ThrowExhausted(min_id_, max_id_);
}

std::unique_ptr<IdAllocator> MakeIdAllocator(const chunkvault::runtime::config::IdAllocationConfig& config) {
  if (config.strategy() == chunkvault::runtime::config::ID_STRATEGY_SEQUENTIAL) {
    return std::make_unique<SequentialIdAllocator>(config.min_id(), config.max_id());
  }
  return std::make_unique<RandomIdAllocator>(config.min_id(), config.max_id(), config.max_random_attempts());
}

} // namespace chunkvault::registry
