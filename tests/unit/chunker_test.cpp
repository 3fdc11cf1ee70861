#include "internal/chunk/chunker.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using chunkvault::chunk::ChunkCount;
using chunkvault::chunk::ChunkLength;
using chunkvault::chunk::ChunkReader;
using chunkvault::chunk::MergeChunkFiles;
using chunkvault::testing::TempDir;

std::vector<std::string> Split(const std::filesystem::path& source, uint64_t chunk_size) {
  ChunkReader              reader(source, chunk_size);
  std::vector<std::string> chunks;
  while (auto chunk = reader.Next()) {
    assert(chunk->ordinal == chunks.size());
    chunks.push_back(chunk->data->ToString());
  }
  assert(reader.bytes_read() == reader.source_size());
  return chunks;
}

std::vector<std::filesystem::path> WriteParts(const std::filesystem::path& dir, const std::vector<std::string>& chunks) {
  std::vector<std::filesystem::path> parts;
  for (size_t i = 0; i < chunks.size(); ++i) {
    parts.push_back(chunkvault::storage::common::ChunkPath(dir, i));
    chunkvault::testing::WriteBytes(parts.back(), chunks[i]);
  }
  return parts;
}

void TestChunkArithmeticForFiftyMegabytes() {
  constexpr uint64_t kSize      = 50'000'000;
  constexpr uint64_t kChunkSize = 24'000'000;

  assert(ChunkCount(kSize, kChunkSize) == 3);
  assert(ChunkLength(kSize, kChunkSize, 0) == 24'000'000);
  assert(ChunkLength(kSize, kChunkSize, 1) == 24'000'000);
  assert(ChunkLength(kSize, kChunkSize, 2) == 2'000'000);
}

void TestChunkCountEdges() {
  assert(ChunkCount(0, 16) == 0);
  assert(ChunkCount(1, 16) == 1);
  assert(ChunkCount(16, 16) == 1);
  assert(ChunkCount(48, 16) == 3);
  assert(ChunkLength(48, 16, 2) == 16);
  assert(ChunkCount(49, 16) == 4);
  assert(ChunkLength(49, 16, 3) == 1);

  bool threw = false;
  try {
    ChunkCount(10, 0);
  } catch (const chunkvault::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    ChunkLength(10, 4, 3);
  } catch (const chunkvault::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestSplitThenMergeReproducesContent() {
  TempDir tmp("chunker_round_trip");

  constexpr uint64_t kChunkSize = 16;
  for (size_t size : {size_t{0}, size_t{5}, size_t{16}, size_t{48}, size_t{53}}) {
    const auto content = chunkvault::testing::PatternBytes(size, static_cast<uint32_t>(size) + 1);
    const auto source  = tmp.path() / ("source-" + std::to_string(size));
    chunkvault::testing::WriteBytes(source, content);

    const auto chunks = Split(source, kChunkSize);
    assert(chunks.size() == ChunkCount(size, kChunkSize));
    for (size_t i = 0; i < chunks.size(); ++i) {
      assert(chunks[i].size() == ChunkLength(size, kChunkSize, i));
    }

    const auto parts_dir = tmp.path() / ("parts-" + std::to_string(size));
    std::filesystem::create_directories(parts_dir);
    const auto parts  = WriteParts(parts_dir, chunks);
    const auto output = tmp.path() / ("merged-" + std::to_string(size));

    MergeChunkFiles(parts, size, output);
    assert(chunkvault::testing::ReadBytes(output) == content);
  }
}

void TestReaderRejectsMissingSource() {
  TempDir tmp("chunker_missing");

  bool threw = false;
  try {
    ChunkReader reader(tmp.path() / "absent.bin", 16);
  } catch (const chunkvault::util::LocalIOError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    ChunkReader reader(tmp.path(), 16);
  } catch (const chunkvault::util::LocalIOError&) {
    threw = true;
  }
  assert(threw);
}

void TestMergeWithMissingPartLeavesNoOutput() {
  TempDir tmp("chunker_missing_part");

  auto parts = WriteParts(tmp.path(), {std::string(8, 'a'), std::string(8, 'b'), std::string(3, 'c')});
  std::filesystem::remove(parts[1]);
  const auto output = tmp.path() / "out.bin";

  bool threw = false;
  try {
    MergeChunkFiles(parts, 19, output);
  } catch (const chunkvault::util::IncompleteTransfer& e) {
    threw = true;
    assert(e.ordinal().has_value() && *e.ordinal() == 1);
  }
  assert(threw);
  assert(!std::filesystem::exists(output));
  assert(chunkvault::testing::CountEntries(tmp.path()) == 2);
}

void TestMergeRejectsShortMiddlePartAndWrongTotal() {
  TempDir tmp("chunker_bad_sizes");
  const auto output = tmp.path() / "out.bin";

  auto parts = WriteParts(tmp.path(), {std::string(8, 'a'), std::string(7, 'b'), std::string(8, 'c')});
  bool threw = false;
  try {
    MergeChunkFiles(parts, 23, output);
  } catch (const chunkvault::util::IncompleteTransfer&) {
    threw = true;
  }
  assert(threw);
  assert(!std::filesystem::exists(output));

  parts = WriteParts(tmp.path(), {std::string(8, 'a'), std::string(8, 'b'), std::string(2, 'c')});
  threw = false;
  try {
    MergeChunkFiles(parts, 20, output);
  } catch (const chunkvault::util::IncompleteTransfer&) {
    threw = true;
  }
  assert(threw);
  assert(!std::filesystem::exists(output));
}

void TestMergeReplacesExistingOutputOnlyOnSuccess() {
  TempDir tmp("chunker_replace");
  const auto output = tmp.path() / "out.bin";
  chunkvault::testing::WriteBytes(output, "previous");

  auto parts = WriteParts(tmp.path(), {std::string(4, 'x'), std::string(4, 'y')});
  std::filesystem::remove(parts[0]);

  bool threw = false;
  try {
    MergeChunkFiles(parts, 8, output);
  } catch (const chunkvault::util::IncompleteTransfer&) {
    threw = true;
  }
  assert(threw);
  assert(chunkvault::testing::ReadBytes(output) == "previous");

  parts = WriteParts(tmp.path(), {std::string(4, 'x'), std::string(4, 'y')});
  MergeChunkFiles(parts, 8, output);
  assert(chunkvault::testing::ReadBytes(output) == "xxxxyyyy");
}

} // namespace

int main() {
  TestChunkArithmeticForFiftyMegabytes();
  TestChunkCountEdges();
  TestSplitThenMergeReproducesContent();
  TestReaderRejectsMissingSource();
  TestMergeWithMissingPartLeavesNoOutput();
  TestMergeRejectsShortMiddlePartAndWrongTotal();
  TestMergeReplacesExistingOutputOnlyOnSuccess();

  std::cout << "chunkvault_unit_chunker: pass\n";
  return 0;
}
