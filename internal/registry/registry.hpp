#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/registry/file_record.hpp"

namespace chunkvault::registry {

class IdAllocator;

/*
  Durable id → FileRecord mapping backed by one JSON document.

  CRITICAL GUARANTEES:

  - Every read loads the whole document; every write rewrites it
  - Writes are atomic replace (tmp + fsync + rename); readers never see a
    torn document
  - Mutations are serialized: a process-local mutex plus an exclusive
    flock on "<path>.lock" for writers in other processes
  - Insert allocates the id and commits the record under the same lock,
    so two concurrent uploads can never claim the same id
*/
class Registry {
 public:
  explicit Registry(std::filesystem::path path);

  // Throws util::NotFound.
  FileRecord Get(FileId id) const;

  std::optional<FileRecord> Find(FileId id) const;

  RecordMap LoadAll() const;

  std::set<FileId> Ids() const;

  // Upsert, last write wins.
  void Put(FileId id, const FileRecord& record);

  FileId Insert(const FileRecord& record, IdAllocator& allocator);

  // External records overwrite existing ones with the same id.
  std::vector<FileId> Import(const RecordMap& records);

  /*
    Write the requested records to "<dir>/<base_name>.json". If that name is
    taken, " (1)", " (2)", ... is inserted before the extension until a free
    name is found; an existing file is never overwritten.

    An empty id list exports every record. Unknown ids throw util::NotFound.
  */
  std::filesystem::path Export(const std::filesystem::path& destination_dir, const std::vector<FileId>& ids,
                               const std::string& base_name) const;

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  class WriteLock;

  RecordMap LoadUnlocked() const;
  void      StoreUnlocked(const RecordMap& records);

  std::filesystem::path path_;

  mutable std::mutex mutex_;
};

} // namespace chunkvault::registry
