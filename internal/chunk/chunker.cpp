#include "chunker.hpp"

#include <atomic>
#include <string>
#include <system_error>
#include <unistd.h>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/file_io.hpp"
#include "internal/util/errors.hpp"

namespace chunkvault::chunk {

using storage::common::Unwrap;

namespace {

constexpr int64_t kCopyBlockBytes = 4 << 20;

std::filesystem::path PartialPath(const std::filesystem::path& output) {
  static std::atomic<uint64_t> counter{0};
  auto parent = output.parent_path();
  auto name   = "." + output.filename().string() + ".partial-" + std::to_string(::getpid()) + "-" + std::to_string(counter++);
  return parent.empty() ? std::filesystem::path(name) : parent / name;
}

uint64_t PartSize(const std::filesystem::path& part, uint64_t ordinal) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(part, ec);
  if (ec) {
    throw util::IncompleteTransfer("chunk " + std::to_string(ordinal) + " is missing", ordinal);
  }
  return size;
}

void CheckPartSizes(const std::vector<std::filesystem::path>& parts, uint64_t total_size) {
  if (parts.empty()) {
    if (total_size != 0) {
      throw util::IncompleteTransfer("no chunks for a non-empty file");
    }
    return;
  }

  const uint64_t first = PartSize(parts.front(), 0);
  uint64_t       sum   = 0;
  for (uint64_t ordinal = 0; ordinal < parts.size(); ++ordinal) {
    const uint64_t size    = PartSize(parts[ordinal], ordinal);
    const bool     is_last = ordinal + 1 == parts.size();
    if (size == 0 || (!is_last && size != first) || (is_last && size > first)) {
      throw util::IncompleteTransfer("chunk " + std::to_string(ordinal) + " has an unexpected length", ordinal);
    }
    sum += size;
  }
  if (sum != total_size) {
    throw util::IncompleteTransfer("chunks hold " + std::to_string(sum) + " bytes, expected " + std::to_string(total_size));
  }
}

void AppendPart(arrow::io::FileOutputStream& out, const std::filesystem::path& part, uint64_t ordinal) {
  auto opened = arrow::io::ReadableFile::Open(part.string());
  if (!opened.ok()) {
    throw util::IncompleteTransfer("chunk " + std::to_string(ordinal) + " is unreadable", ordinal);
  }
  auto in = *opened;
  while (true) {
    auto block = in->Read(kCopyBlockBytes);
    if (!block.ok()) {
      throw util::IncompleteTransfer("chunk " + std::to_string(ordinal) + " is unreadable", ordinal);
    }
    if ((*block)->size() == 0) break;
    Unwrap(out.Write(*block));
  }
  Unwrap(in->Close());
}

} // namespace

uint64_t ChunkCount(uint64_t size, uint64_t chunk_size) {
  if (chunk_size == 0) {
    throw util::InvalidArgument("chunk size must be > 0");
  }
  return size / chunk_size + (size % chunk_size != 0 ? 1 : 0);
}

uint64_t ChunkLength(uint64_t size, uint64_t chunk_size, uint64_t ordinal) {
  const uint64_t count = ChunkCount(size, chunk_size);
  if (ordinal >= count) {
    throw util::InvalidArgument("chunk ordinal " + std::to_string(ordinal) + " out of range");
  }
  if (ordinal + 1 < count) {
    return chunk_size;
  }
  const uint64_t remainder = size % chunk_size;
  return remainder == 0 ? chunk_size : remainder;
}

// ------------------------------------------------------------
// Split
// ------------------------------------------------------------

ChunkReader::ChunkReader(const std::filesystem::path& source, uint64_t chunk_size) : chunk_size_(chunk_size) {
  if (chunk_size_ == 0) {
    throw util::InvalidArgument("chunk size must be > 0");
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(source, ec)) {
    throw util::LocalIOError("source is not a readable file: " + source.string());
  }

  auto opened = arrow::io::ReadableFile::Open(source.string());
  if (!opened.ok()) {
    throw util::LocalIOError("cannot open source " + source.string() + ": " + opened.status().message());
  }
  file_        = *opened;
  source_size_ = static_cast<uint64_t>(Unwrap(file_->GetSize()));
}

ChunkReader::~ChunkReader() {
  if (file_ && !file_->closed()) {
    auto status = file_->Close();
    if (!status.ok()) {
      CHUNKVAULT_LOG_WARN("Closing chunk source failed", {observability::StringField("error", status.ToString())});
    }
  }
}

std::optional<Chunk> ChunkReader::Next() {
  if (exhausted_) {
    return std::nullopt;
  }

  auto data = Unwrap(file_->Read(static_cast<int64_t>(chunk_size_)));
  if (data->size() == 0) {
    exhausted_ = true;
    Unwrap(file_->Close());
    return std::nullopt;
  }

  bytes_read_ += static_cast<uint64_t>(data->size());
  return Chunk{next_ordinal_++, std::move(data)};
}

// ------------------------------------------------------------
// Merge
// ------------------------------------------------------------

void MergeChunkFiles(const std::vector<std::filesystem::path>& ordered_parts, uint64_t total_size,
                     const std::filesystem::path& output) {
  CheckPartSizes(ordered_parts, total_size);

  const auto partial = PartialPath(output);
  try {
    {
      auto opened = arrow::io::FileOutputStream::Open(partial.string());
      if (!opened.ok()) {
        throw util::LocalIOError("destination is not writable: " + opened.status().message());
      }
      auto out = *opened;
      for (uint64_t ordinal = 0; ordinal < ordered_parts.size(); ++ordinal) {
        AppendPart(*out, ordered_parts[ordinal], ordinal);
      }
      Unwrap(out->Close());
    }

    std::error_code ec;
    const auto      written = std::filesystem::file_size(partial, ec);
    if (ec || written != total_size) {
      throw util::IncompleteTransfer("merged output has the wrong length");
    }

    std::filesystem::rename(partial, output, ec);
    if (ec) {
      throw util::LocalIOError("cannot move merged output into place: " + ec.message());
    }
  } catch (...) {
    storage::common::RemoveQuietly(partial);
    throw;
  }
}

} // namespace chunkvault::chunk
