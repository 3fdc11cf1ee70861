#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "internal/registry/file_record.hpp"
#include "internal/transfer/cancellation.hpp"
#include "internal/transfer/progress.hpp"

namespace chunkvault::registry {
class IdAllocator;
class Registry;
} // namespace chunkvault::registry

namespace chunkvault::transfer {
class TransferEngine;
}

namespace chunkvault::core {

struct VaultOptions {
  // Parent of per-operation scratch directories.
  std::filesystem::path work_dir;

  // Used when a download names no destination.
  std::filesystem::path download_dir;

  // Default and upper bound for the per-upload chunk size.
  uint64_t chunk_size_bytes = 24000000;
};

struct StoredFile {
  registry::FileId     id = 0;
  registry::FileRecord record;
};

struct DownloadedFile {
  std::filesystem::path path;
  StoredFile            file;
};

struct FileSummary {
  registry::FileId id = 0;
  std::string      filename;
  uint64_t         size_bytes  = 0;
  uint64_t         chunk_count = 0;
};

/*
  Upload / download orchestration over registry + transfer engine.

  A record is committed only after every chunk of the file was uploaded,
  and a download output appears only once all its bytes are on disk.
*/
class Vault {
 public:
  Vault(std::shared_ptr<registry::Registry> registry, std::shared_ptr<registry::IdAllocator> allocator,
        std::shared_ptr<transfer::TransferEngine> engine, VaultOptions options);

  // chunk_size_bytes == 0 uses the configured size.
  StoredFile Upload(const std::filesystem::path& source, uint64_t chunk_size_bytes, transfer::CancellationToken& cancel,
                    const transfer::ProgressCallback& progress = {});

  // An empty destination_dir means the configured download directory.
  DownloadedFile Download(registry::FileId id, const std::filesystem::path& destination_dir, transfer::CancellationToken& cancel,
                          const transfer::ProgressCallback& progress = {});

  StoredFile Stat(registry::FileId id) const;

  std::vector<FileSummary> List() const;

  std::vector<registry::FileId> Import(const std::filesystem::path& document) const;

  std::filesystem::path Export(const std::filesystem::path& destination_dir, const std::vector<registry::FileId>& ids,
                               const std::string& base_name) const;

 private:
  std::shared_ptr<registry::Registry>       registry_;
  std::shared_ptr<registry::IdAllocator>    allocator_;
  std::shared_ptr<transfer::TransferEngine> engine_;
  VaultOptions                              options_;
};

} // namespace chunkvault::core
