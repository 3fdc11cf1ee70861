#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "internal/transfer/cancellation.hpp"
#include "internal/transfer/progress.hpp"
#include "internal/transfer/retry_policy.hpp"
#include "internal/transport/blob_transport.hpp"
#include "internal/transport/endpoint_pool.hpp"

namespace chunkvault::chunk {
class ChunkReader;
}

namespace chunkvault::transfer {

struct TransferOptions {
  // Chunks uploaded concurrently; the next batch starts once all of them
  // have finished.
  uint32_t upload_batch_size = 4;

  // Chunks fetched concurrently; 0 fetches all chunks of a file at once.
  uint32_t download_concurrency = 8;

  RetryPolicy retry;
};

/*
  Moves chunks between local storage and the endpoint pool.

  Results are always indexed by ordinal, whatever order the requests
  complete in. The first chunk that fails for good cancels its siblings and
  the whole transfer is abandoned: an upload returns no partial locator
  list, a download leaves whatever it fetched to the caller's scratch space.
*/
class TransferEngine {
 public:
  TransferEngine(std::shared_ptr<transport::BlobTransport> transport, transport::EndpointPool pool, TransferOptions options);

  /*
    Upload every chunk `reader` yields. Chunk i is named "<name>.<i>" and
    sent to pool.Assign(i). Returns the locators in ordinal order.

    Throws util::EmptyPool, util::OperationFailed, util::Cancelled or
    util::LocalIOError (source read failure).
  */
  std::vector<std::string> Upload(chunk::ChunkReader& reader, const std::string& name, CancellationToken& cancel,
                                  const ProgressCallback& progress = {});

  /*
    Fetch urls[i] into ChunkPath(scratch_dir, i) for every i. Returns the
    part paths in ordinal order.

    `label` prefixes error messages (e.g. "download of file 42").
  */
  std::vector<std::filesystem::path> Download(const std::vector<std::string>& urls, uint64_t total_size,
                                              const std::filesystem::path& scratch_dir, const std::string& label,
                                              CancellationToken& cancel, const ProgressCallback& progress = {});

  const transport::EndpointPool& pool() const {
    return pool_;
  }

  const TransferOptions& options() const {
    return options_;
  }

 private:
  std::string UploadChunk(uint64_t ordinal, const std::shared_ptr<arrow::Buffer>& data, const std::string& name,
                          ProgressTracker& tracker, CancellationToken& cancel);

  void FetchChunk(uint64_t ordinal, const std::string& url, const std::filesystem::path& part, const std::string& label,
                  ProgressTracker& tracker, CancellationToken& cancel);

  std::shared_ptr<transport::BlobTransport> transport_;
  transport::EndpointPool                   pool_;
  TransferOptions                           options_;
};

} // namespace chunkvault::transfer
