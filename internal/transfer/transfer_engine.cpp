#include "transfer_engine.hpp"

#include <arrow/io/file.h>

#include <algorithm>
#include <exception>
#include <future>
#include <utility>

#include "internal/chunk/chunker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace chunkvault::transfer {

namespace {

/*
  Run fn(ordinal) for every ordinal concurrently and join all of them.

  A failing task cancels the token so its siblings stop early. After the
  join, a real failure wins over the Cancelled errors it caused.
*/
template <typename Fn>
void RunConcurrently(const std::vector<uint64_t>& ordinals, CancellationToken& cancel, Fn&& fn) {
  std::vector<std::future<void>> tasks;
  tasks.reserve(ordinals.size());

  try {
    for (uint64_t ordinal : ordinals) {
      tasks.push_back(std::async(std::launch::async, [&fn, &cancel, ordinal] {
        try {
          fn(ordinal);
        } catch (...) {
          cancel.Cancel();
          throw;
        }
      }));
    }
  } catch (...) {
    // Could not start a task; launched ones are joined by their futures.
    cancel.Cancel();
    throw;
  }

  std::exception_ptr failure;
  std::exception_ptr cancelled;
  for (auto& task : tasks) {
    try {
      task.get();
    } catch (const util::Cancelled&) {
      if (!cancelled) cancelled = std::current_exception();
    } catch (...) {
      if (!failure) failure = std::current_exception();
    }
  }

  if (failure) std::rethrow_exception(failure);
  if (cancelled) std::rethrow_exception(cancelled);
}

// Scratch paths stay out of the error messages. Opening truncates, so a
// retried fetch starts from an empty part.
std::shared_ptr<arrow::io::FileOutputStream> OpenPart(const std::filesystem::path& part, uint64_t ordinal) {
  auto opened = arrow::io::FileOutputStream::Open(part.string());
  if (!opened.ok()) {
    throw util::LocalIOError("cannot store chunk " + std::to_string(ordinal) + " in scratch space");
  }
  return *opened;
}

void ClosePart(arrow::io::FileOutputStream& out, uint64_t ordinal) {
  auto status = out.Close();
  if (!status.ok()) {
    throw util::LocalIOError("cannot store chunk " + std::to_string(ordinal) + " in scratch space: " + status.message());
  }
}

} // namespace

TransferEngine::TransferEngine(std::shared_ptr<transport::BlobTransport> transport, transport::EndpointPool pool,
                               TransferOptions options)
    : transport_(std::move(transport)), pool_(std::move(pool)), options_(std::move(options)) {
  if (!transport_) {
    throw util::InvalidArgument("transfer engine requires a transport");
  }
}

// ---------------------------------------------------------------------------
// Upload
// ---------------------------------------------------------------------------

std::vector<std::string> TransferEngine::Upload(chunk::ChunkReader& reader, const std::string& name,
                                                CancellationToken& cancel, const ProgressCallback& progress) {
  pool_.RequireNonEmpty();

  const uint64_t expected_chunks = chunk::ChunkCount(reader.source_size(), reader.chunk_size());
  ProgressTracker tracker(reader.source_size(), static_cast<uint32_t>(expected_chunks), progress);

  const size_t batch_size = std::max<uint32_t>(1, options_.upload_batch_size);

  std::vector<std::string> urls;
  urls.reserve(expected_chunks);

  while (true) {
    cancel.ThrowIfCancelled("upload of " + name);

    std::vector<chunk::Chunk> batch;
    while (batch.size() < batch_size) {
      auto next = reader.Next();
      if (!next) break;
      batch.push_back(std::move(*next));
    }
    if (batch.empty()) break;

    const uint64_t first = batch.front().ordinal;
    std::vector<uint64_t> ordinals;
    for (const auto& c : batch) {
      ordinals.push_back(c.ordinal);
    }
    urls.resize(batch.back().ordinal + 1);

    try {
      RunConcurrently(ordinals, cancel, [&](uint64_t ordinal) {
        urls[ordinal] = UploadChunk(ordinal, batch[ordinal - first].data, name, tracker, cancel);
      });
    } catch (const std::exception& e) {
      CHUNKVAULT_LOG_ERROR("Upload aborted", {observability::StringField("file", name), observability::UintField("batch_start", first),
                                              observability::StringField("error", e.what())});
      throw;
    }

    CHUNKVAULT_LOG_DEBUG("Upload batch complete", {observability::StringField("file", name), observability::UintField("batch_start", first),
                                                   observability::UintField("chunks", batch.size())});
  }

  return urls;
}

std::string TransferEngine::UploadChunk(uint64_t ordinal, const std::shared_ptr<arrow::Buffer>& data, const std::string& name,
                                        ProgressTracker& tracker, CancellationToken& cancel) {
  const auto&       endpoint   = pool_.Assign(ordinal);
  const std::string chunk_name = name + "." + std::to_string(ordinal);
  const uint64_t    size       = static_cast<uint64_t>(data->size());

  return WithRetry(options_.retry, cancel, "upload of chunk " + std::to_string(ordinal) + " of " + name, ordinal, [&](uint32_t) {
    tracker.SetChunkBytes(ordinal, 0);

    transport::TransferContext ctx;
    ctx.cancel      = &cancel;
    ctx.on_progress = [&tracker, ordinal, size](uint64_t bytes) { tracker.SetChunkBytes(ordinal, std::min(bytes, size)); };

    auto url = transport_->Upload(endpoint, chunk_name, data, ctx);
    tracker.CompleteChunk(ordinal, size);
    return url;
  });
}

// ---------------------------------------------------------------------------
// Download
// ---------------------------------------------------------------------------

std::vector<std::filesystem::path> TransferEngine::Download(const std::vector<std::string>& urls, uint64_t total_size,
                                                            const std::filesystem::path& scratch_dir, const std::string& label,
                                                            CancellationToken& cancel, const ProgressCallback& progress) {
  ProgressTracker tracker(total_size, static_cast<uint32_t>(urls.size()), progress);

  std::vector<std::filesystem::path> parts;
  parts.reserve(urls.size());
  for (uint64_t ordinal = 0; ordinal < urls.size(); ++ordinal) {
    parts.push_back(storage::common::ChunkPath(scratch_dir, ordinal));
  }

  const size_t window = options_.download_concurrency == 0 ? std::max<size_t>(1, urls.size()) : options_.download_concurrency;

  for (size_t start = 0; start < urls.size(); start += window) {
    cancel.ThrowIfCancelled(label);

    std::vector<uint64_t> ordinals;
    for (size_t ordinal = start; ordinal < std::min(urls.size(), start + window); ++ordinal) {
      ordinals.push_back(ordinal);
    }

    try {
      RunConcurrently(ordinals, cancel,
                      [&](uint64_t ordinal) { FetchChunk(ordinal, urls[ordinal], parts[ordinal], label, tracker, cancel); });
    } catch (const std::exception& e) {
      CHUNKVAULT_LOG_ERROR("Download aborted", {observability::StringField("operation", label), observability::UintField("window_start", start),
                                                observability::StringField("error", e.what())});
      throw;
    }
  }

  return parts;
}

void TransferEngine::FetchChunk(uint64_t ordinal, const std::string& url, const std::filesystem::path& part,
                                const std::string& label, ProgressTracker& tracker, CancellationToken& cancel) {
  const auto written = WithRetry(options_.retry, cancel, label + ": chunk " + std::to_string(ordinal), ordinal, [&](uint32_t) {
    tracker.SetChunkBytes(ordinal, 0);

    transport::TransferContext ctx;
    ctx.cancel      = &cancel;
    ctx.on_progress = [&tracker, ordinal](uint64_t bytes) { tracker.SetChunkBytes(ordinal, bytes); };

    auto           out   = OpenPart(part, ordinal);
    const uint64_t bytes = transport_->Fetch(url, out.get(), ctx);
    ClosePart(*out, ordinal);
    if (bytes == 0) {
      throw util::TransportError("empty chunk body", 0, true);
    }
    return bytes;
  });

  tracker.CompleteChunk(ordinal, written);
}

} // namespace chunkvault::transfer
