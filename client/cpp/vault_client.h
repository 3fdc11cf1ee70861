#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "chunkvault/v1.hpp"

namespace chunkvault::client {

// Decimal file id, no sign or whitespace, > 0.
arrow::Result<uint64_t> ParseFileId(std::string_view text);

/*
  Absolute form of a path given on this host's command line. The daemon
  resolves relative paths against its own working directory, so callers
  resolve them here first. An empty path stays empty.
*/
arrow::Result<std::string> ResolveLocalPath(const std::string& path);

class VaultClient {
 public:
  using ProgressHandler = std::function<void(const chunkvault::v1::TransferProgress&)>;

  explicit VaultClient(std::shared_ptr<grpc::Channel> channel);

  // source_path is resolved on the daemon's host.
  arrow::Result<chunkvault::v1::FileRecord> Upload(const std::string& source_path, uint64_t chunk_size_bytes = 0,
                                                   const ProgressHandler& on_progress = {}) const;

  arrow::Result<chunkvault::v1::DownloadResult> Download(uint64_t file_id, const std::string& destination_dir = "",
                                                         const ProgressHandler& on_progress = {}) const;

  arrow::Result<chunkvault::v1::FileRecord> Stat(uint64_t file_id) const;

  arrow::Result<std::vector<chunkvault::v1::FileSummary>> List() const;

  arrow::Result<std::vector<uint64_t>> Import(const std::string& document_path) const;

  arrow::Result<std::string> Export(const std::string& destination_dir, const std::vector<uint64_t>& file_ids,
                                    const std::string& base_name) const;

 private:
  std::unique_ptr<chunkvault::v1::VaultService::Stub> stub_;
};

} // namespace chunkvault::client
