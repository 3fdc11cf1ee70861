#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace chunkvault::chunk {

struct Chunk {
  uint64_t ordinal = 0;

  std::shared_ptr<arrow::Buffer> data;
};

// ceil(size / chunk_size); zero for an empty file.
uint64_t ChunkCount(uint64_t size, uint64_t chunk_size);

// Length of chunk `ordinal` of a file of `size` bytes.
uint64_t ChunkLength(uint64_t size, uint64_t chunk_size, uint64_t ordinal);

/*
  Lazy split of a file into chunk_size pieces.

  Only one chunk is held by the reader at a time; callers decide how many
  they keep in flight. Every chunk but the last is exactly chunk_size bytes.
*/
class ChunkReader {
 public:
  // Throws util::LocalIOError if the source cannot be opened.
  ChunkReader(const std::filesystem::path& source, uint64_t chunk_size);
  ~ChunkReader();

  ChunkReader(const ChunkReader&)            = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  // std::nullopt once the source is exhausted.
  std::optional<Chunk> Next();

  // Size reported when the source was opened.
  uint64_t source_size() const {
    return source_size_;
  }

  uint64_t bytes_read() const {
    return bytes_read_;
  }

  uint64_t chunk_size() const {
    return chunk_size_;
  }

 private:
  std::shared_ptr<arrow::io::ReadableFile> file_;

  uint64_t chunk_size_;
  uint64_t source_size_  = 0;
  uint64_t bytes_read_   = 0;
  uint64_t next_ordinal_ = 0;
  bool     exhausted_    = false;
};

/*
  Concatenate chunk files strictly in ordinal order into `output`.

  The bytes go to a hidden sibling of `output` which is renamed into place
  only after the full `total_size` bytes were written, so a failed merge
  never leaves a partial output file. Throws util::IncompleteTransfer when a
  part is missing or the sizes do not add up, util::LocalIOError when the
  destination cannot be written.
*/
void MergeChunkFiles(const std::vector<std::filesystem::path>& ordered_parts, uint64_t total_size,
                     const std::filesystem::path& output);

} // namespace chunkvault::chunk
