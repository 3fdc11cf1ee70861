#include "registry.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/registry/file_id.hpp"
#include "internal/registry/id_allocator.hpp"
#include "internal/registry/registry_document.hpp"
#include "internal/storage/common/file_io.hpp"
#include "internal/util/errors.hpp"

namespace chunkvault::registry {

using observability::StringField;
using observability::UintField;

namespace {

constexpr int kMaxExportSuffix = 10'000;

std::string ExportStem(const std::string& base_name) {
  static const std::string kExtension = ".json";
  if (base_name.size() > kExtension.size() &&
      base_name.compare(base_name.size() - kExtension.size(), kExtension.size(), kExtension) == 0) {
    return base_name.substr(0, base_name.size() - kExtension.size());
  }
  return base_name;
}

} // namespace

/*
  Exclusive advisory lock on "<registry>.lock". Held only across a
  load-modify-store cycle.
*/
class Registry::WriteLock {
 public:
  explicit WriteLock(const std::filesystem::path& registry_path) {
    const auto lock_path = registry_path.string() + ".lock";
    fd_ = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
      throw util::RegistryError(std::string("cannot open registry lock: ") + std::strerror(errno));
    }
    while (::flock(fd_, LOCK_EX) != 0) {
      if (errno == EINTR) continue;
      const int saved_errno = errno;
      ::close(fd_);
      throw util::RegistryError(std::string("cannot lock registry: ") + std::strerror(saved_errno));
    }
  }

  ~WriteLock() {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }

  WriteLock(const WriteLock&)            = delete;
  WriteLock& operator=(const WriteLock&) = delete;

 private:
  int fd_ = -1;
};

Registry::Registry(std::filesystem::path path) : path_(std::move(path)) {
  auto parent = path_.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw util::RegistryError("cannot create registry directory: " + ec.message());
    }
  }
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

RecordMap Registry::LoadUnlocked() const {
  std::optional<std::string> content;
  try {
    content = storage::common::ReadFileIfExists(path_);
  } catch (const util::LocalIOError& e) {
    throw util::RegistryError(std::string("registry unreadable: ") + e.what());
  }
  if (!content) {
    return {};
  }
  return ParseRegistryDocument(*content);
}

FileRecord Registry::Get(FileId id) const {
  auto record = Find(id);
  if (!record) {
    throw util::NotFound("no such file: " + FormatFileId(id));
  }
  return *record;
}

std::optional<FileRecord> Registry::Find(FileId id) const {
  std::lock_guard lock(mutex_);
  auto records = LoadUnlocked();
  auto it      = records.find(id);
  if (it == records.end()) return std::nullopt;
  return it->second;
}

RecordMap Registry::LoadAll() const {
  std::lock_guard lock(mutex_);
  return LoadUnlocked();
}

std::set<FileId> Registry::Ids() const {
  std::set<FileId> ids;
  for (const auto& [id, _] : LoadAll()) {
    ids.insert(id);
  }
  return ids;
}

// ------------------------------------------------------------
// Writes
// ------------------------------------------------------------

void Registry::StoreUnlocked(const RecordMap& records) {
  const auto document = SerializeRegistryDocument(records);
  try {
    storage::common::WriteFileAtomic(path_, document);
  } catch (const util::LocalIOError& e) {
    throw util::RegistryError(std::string("registry write failed: ") + e.what());
  }
}

void Registry::Put(FileId id, const FileRecord& record) {
  std::lock_guard lock(mutex_);
  WriteLock       file_lock(path_);

  auto records = LoadUnlocked();
  records[id]  = record;
  StoreUnlocked(records);
}

FileId Registry::Insert(const FileRecord& record, IdAllocator& allocator) {
  std::lock_guard lock(mutex_);
  WriteLock       file_lock(path_);

  auto records = LoadUnlocked();

  std::set<FileId> existing;
  for (const auto& [id, _] : records) {
    existing.insert(id);
  }

  const FileId id = allocator.Allocate(existing);
  records[id]     = record;
  StoreUnlocked(records);

  CHUNKVAULT_LOG_INFO("Registry insert", {UintField("file_id", id), StringField("filename", record.filename),
                                          UintField("size", record.size), UintField("chunks", record.urls.size())});
  return id;
}

std::vector<FileId> Registry::Import(const RecordMap& external) {
  std::lock_guard lock(mutex_);
  WriteLock       file_lock(path_);

  auto records = LoadUnlocked();

  std::vector<FileId> imported;
  imported.reserve(external.size());
  for (const auto& [id, record] : external) {
    records[id] = record;
    imported.push_back(id);
  }
  StoreUnlocked(records);

  CHUNKVAULT_LOG_INFO("Registry import", {UintField("records", imported.size())});
  return imported;
}

// ------------------------------------------------------------
// Export
// ------------------------------------------------------------

std::filesystem::path Registry::Export(const std::filesystem::path& destination_dir, const std::vector<FileId>& ids,
                                       const std::string& base_name) const {
  const auto stem = ExportStem(base_name);
  if (stem.empty() || stem.find_first_of("/\\") != std::string::npos || stem == "." || stem == "..") {
    throw util::InvalidArgument("export base name must be a plain file name");
  }

  RecordMap selected;
  {
    auto records = LoadAll();
    if (ids.empty()) {
      selected = std::move(records);
    } else {
      for (FileId id : ids) {
        auto it = records.find(id);
        if (it == records.end()) {
          throw util::NotFound("no such file: " + FormatFileId(id));
        }
        selected[id] = it->second;
      }
    }
  }

  std::error_code ec;
  std::filesystem::create_directories(destination_dir, ec);
  if (ec) {
    throw util::LocalIOError("cannot create export directory: " + ec.message());
  }

  const auto document = SerializeRegistryDocument(selected);

  for (int suffix = 0; suffix < kMaxExportSuffix; ++suffix) {
    auto name = suffix == 0 ? stem + ".json" : stem + " (" + std::to_string(suffix) + ").json";
    auto path = destination_dir / name;
    if (storage::common::CreateFileExclusive(path, document)) {
      CHUNKVAULT_LOG_INFO("Registry export", {StringField("path", path.string()), UintField("records", selected.size())});
      return path;
    }
  }
  throw util::LocalIOError("no free export name for '" + stem + "'");
}

} // namespace chunkvault::registry
