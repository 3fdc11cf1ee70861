#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <set>

#include "internal/registry/file_record.hpp"

namespace chunkvault::runtime::config {
class IdAllocationConfig;
}

namespace chunkvault::registry {

/*
  Picks a file id that is not in `existing`.

  Called by the registry while it holds its write lock, so the result is
  unique at commit time, not only at allocation time.
*/
class IdAllocator {
 public:
  virtual ~IdAllocator() = default;

  // Throws util::ExhaustedIdSpace if every id in the space is taken.
  virtual FileId Allocate(const std::set<FileId>& existing) = 0;
};

/*
  Uniform draws over [min_id, max_id].

  After max_attempts colliding draws the space is scanned from a random
  start, so a nearly full space still allocates in bounded time.
*/
class RandomIdAllocator final : public IdAllocator {
 public:
  RandomIdAllocator(FileId min_id, FileId max_id, uint32_t max_attempts, uint64_t seed = std::random_device{}());

  FileId Allocate(const std::set<FileId>& existing) override;

 private:
  FileId   min_id_;
  FileId   max_id_;
  uint32_t max_attempts_;

  std::mt19937_64 rng_;
};

// Next id after the highest one in use; reuses gaps once max_id is reached.
class SequentialIdAllocator final : public IdAllocator {
 public:
  SequentialIdAllocator(FileId min_id, FileId max_id);

  FileId Allocate(const std::set<FileId>& existing) override;

 private:
  FileId min_id_;
  FileId max_id_;
};

std::unique_ptr<IdAllocator> MakeIdAllocator(const chunkvault::runtime::config::IdAllocationConfig& config);

} // namespace chunkvault::registry
