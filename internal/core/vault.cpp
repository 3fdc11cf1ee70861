#include "vault.hpp"

#include <chrono>
#include <system_error>
#include <utility>

#include "internal/chunk/chunker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/file_id.hpp"
#include "internal/registry/id_allocator.hpp"
#include "internal/registry/registry.hpp"
#include "internal/registry/registry_document.hpp"
#include "internal/storage/common/file_io.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/scratch_space.hpp"
#include "internal/transfer/transfer_engine.hpp"
#include "internal/util/errors.hpp"

namespace chunkvault::core {

using observability::StringField;
using observability::UintField;

namespace {

uint64_t ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count());
}

} // namespace

Vault::Vault(std::shared_ptr<registry::Registry> registry, std::shared_ptr<registry::IdAllocator> allocator,
             std::shared_ptr<transfer::TransferEngine> engine, VaultOptions options)
    : registry_(std::move(registry)), allocator_(std::move(allocator)), engine_(std::move(engine)), options_(std::move(options)) {
  if (!registry_ || !allocator_ || !engine_) {
    throw util::InvalidArgument("vault requires registry, id allocator and transfer engine");
  }
  if (options_.chunk_size_bytes == 0) {
    throw util::InvalidArgument("chunk size must be > 0");
  }
}

StoredFile Vault::Upload(const std::filesystem::path& source, uint64_t chunk_size_bytes, transfer::CancellationToken& cancel,
                         const transfer::ProgressCallback& progress) {
  engine_->pool().RequireNonEmpty();

  const uint64_t chunk_size = chunk_size_bytes == 0 ? options_.chunk_size_bytes : chunk_size_bytes;
  if (chunk_size > options_.chunk_size_bytes) {
    throw util::InvalidArgument("chunk size " + std::to_string(chunk_size) + " exceeds the configured maximum of " +
                                std::to_string(options_.chunk_size_bytes));
  }

  const std::string filename = source.filename().string();
  if (!storage::common::IsUsableFilename(filename)) {
    throw util::InvalidArgument("source path has no file name: " + source.string());
  }

  chunk::ChunkReader reader(source, chunk_size);

  const auto started_at = std::chrono::steady_clock::now();
  CHUNKVAULT_LOG_INFO("Upload started", {StringField("filename", filename), UintField("size", reader.source_size()),
                                         UintField("chunks", chunk::ChunkCount(reader.source_size(), chunk_size))});

  registry::FileRecord record;
  record.filename = filename;
  record.urls     = engine_->Upload(reader, filename, cancel, progress);
  record.size     = reader.bytes_read();

  if (record.size != reader.source_size()) {
    throw util::LocalIOError("source " + filename + " changed size during upload");
  }

  StoredFile stored;
  stored.id     = registry_->Insert(record, *allocator_);
  stored.record = std::move(record);

  CHUNKVAULT_LOG_INFO("Upload finished", {UintField("file_id", stored.id), StringField("filename", filename),
                                          UintField("size", stored.record.size), UintField("chunks", stored.record.urls.size()),
                                          UintField("elapsed_ms", ElapsedMs(started_at))});
  return stored;
}

DownloadedFile Vault::Download(registry::FileId id, const std::filesystem::path& destination_dir, transfer::CancellationToken& cancel,
                               const transfer::ProgressCallback& progress) {
  auto record = registry_->Get(id);

  const auto destination = destination_dir.empty() ? options_.download_dir : destination_dir;
  std::error_code ec;
  std::filesystem::create_directories(destination, ec);
  if (ec || !std::filesystem::is_directory(destination)) {
    throw util::LocalIOError("cannot create destination directory " + destination.string());
  }

  const auto filename = storage::common::SafeFilename(record.filename, "file-" + registry::FormatFileId(id));
  const auto output   = destination / filename;
  const auto label    = "download of file " + registry::FormatFileId(id);

  const auto started_at = std::chrono::steady_clock::now();
  CHUNKVAULT_LOG_INFO("Download started", {UintField("file_id", id), StringField("filename", record.filename),
                                           UintField("size", record.size), UintField("chunks", record.urls.size())});

  {
    storage::ScratchSpace scratch(options_.work_dir, "download-" + registry::FormatFileId(id));

    auto parts = engine_->Download(record.urls, record.size, scratch.path(), label, cancel, progress);
    cancel.ThrowIfCancelled(label);
    chunk::MergeChunkFiles(parts, record.size, output);
  }

  CHUNKVAULT_LOG_INFO("Download finished", {UintField("file_id", id), StringField("path", output.string()),
                                            UintField("size", record.size), UintField("elapsed_ms", ElapsedMs(started_at))});

  DownloadedFile downloaded;
  downloaded.path        = output;
  downloaded.file.id     = id;
  downloaded.file.record = std::move(record);
  return downloaded;
}

StoredFile Vault::Stat(registry::FileId id) const {
  return StoredFile{id, registry_->Get(id)};
}

std::vector<FileSummary> Vault::List() const {
  std::vector<FileSummary> files;
  for (const auto& [id, record] : registry_->LoadAll()) {
    files.push_back(FileSummary{id, record.filename, record.size, record.urls.size()});
  }
  return files;
}

std::vector<registry::FileId> Vault::Import(const std::filesystem::path& document) const {
  auto content = storage::common::ReadFileIfExists(document);
  if (!content) {
    throw util::NotFound("import document not found: " + document.string());
  }

  auto records = registry::ParseRegistryDocument(*content);
  return registry_->Import(records);
}

std::filesystem::path Vault::Export(const std::filesystem::path& destination_dir, const std::vector<registry::FileId>& ids,
                                    const std::string& base_name) const {
  return registry_->Export(destination_dir, ids, base_name);
}

} // namespace chunkvault::core
