#include "internal/registry/id_allocator.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <set>
#include <string>

#include "config/config.pb.h"
#include "internal/registry/file_id.hpp"
#include "internal/util/errors.hpp"

namespace {

using chunkvault::registry::FileId;
using chunkvault::registry::ParseFileId;
using chunkvault::registry::RandomIdAllocator;
using chunkvault::registry::SequentialIdAllocator;

template <typename Fn>
bool ThrowsExhausted(Fn&& fn) {
  try {
    fn();
  } catch (const chunkvault::util::ExhaustedIdSpace&) {
    return true;
  }
  return false;
}

template <typename Fn>
bool ThrowsInvalid(Fn&& fn) {
  try {
    fn();
  } catch (const chunkvault::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestRandomNeverReturnsExistingId() {
  RandomIdAllocator allocator(1, 9999, 64, 42);

  std::set<FileId> existing;
  for (int i = 0; i < 2000; ++i) {
    const FileId id = allocator.Allocate(existing);
    assert(id >= 1 && id <= 9999);
    assert(!existing.contains(id));
    existing.insert(id);
  }
}

void TestRandomFindsLastFreeIdInDenseSpace() {
  // One attempt only, so the scan fallback has to find the gap.
  RandomIdAllocator allocator(1, 10, 1, 7);

  std::set<FileId> existing;
  for (FileId id = 1; id <= 10; ++id) {
    if (id != 6) existing.insert(id);
  }
  for (int i = 0; i < 20; ++i) {
    assert(allocator.Allocate(existing) == 6);
  }
}

void TestRandomFullSpaceIsExhausted() {
  RandomIdAllocator allocator(1, 3, 64, 1);
  const std::set<FileId> existing{1, 2, 3, 50};
  assert(ThrowsExhausted([&] { allocator.Allocate(existing); }));
}

void TestSequentialContinuesAfterHighestAndReusesGaps() {
  SequentialIdAllocator allocator(1, 5);

  assert(allocator.Allocate({}) == 1);
  assert(allocator.Allocate({1, 2}) == 3);
  assert(allocator.Allocate({2, 4}) == 5);
  assert(allocator.Allocate({2, 3, 4, 5}) == 1);
  assert(allocator.Allocate({1, 2, 4, 5}) == 3);
  assert(allocator.Allocate({1, 2, 3, 4, 100}) == 5);
  assert(ThrowsExhausted([&] { allocator.Allocate({1, 2, 3, 4, 5}); }));
}

void TestInvalidRangesRejected() {
  assert(ThrowsInvalid([] { RandomIdAllocator(0, 10, 1); }));
  assert(ThrowsInvalid([] { SequentialIdAllocator(10, 9); }));
}

void TestFactoryHonoursStrategy() {
  chunkvault::runtime::config::IdAllocationConfig config;
  config.set_strategy(chunkvault::runtime::config::ID_STRATEGY_SEQUENTIAL);
  config.set_min_id(100);
  config.set_max_id(200);

  auto allocator = chunkvault::registry::MakeIdAllocator(config);
  assert(allocator->Allocate({}) == 100);
  assert(allocator->Allocate({100, 150}) == 151);
}

void TestParseFileId() {
  assert(ParseFileId("42") == 42);
  assert(ParseFileId("0042") == 42);
  assert(ParseFileId("18446744073709551615") == UINT64_MAX);

  for (const char* bad : {"", "0", "-1", "+1", " 1", "1 ", "1a", "18446744073709551616"}) {
    assert(ThrowsInvalid([bad] { ParseFileId(bad); }));
  }
}

} // namespace

int main() {
  TestRandomNeverReturnsExistingId();
  TestRandomFindsLastFreeIdInDenseSpace();
  TestRandomFullSpaceIsExhausted();
  TestSequentialContinuesAfterHighestAndReusesGaps();
  TestInvalidRangesRejected();
  TestFactoryHonoursStrategy();
  TestParseFileId();

  std::cout << "chunkvault_unit_id_allocator: pass\n";
  return 0;
}
