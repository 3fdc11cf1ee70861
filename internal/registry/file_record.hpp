#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace chunkvault::registry {

using FileId = uint64_t;

/*
  One stored file.

  urls[i] is the locator of chunk ordinal i. The chunk size used at upload
  time is not stored: every chunk but the last has the same length, so the
  locator count and size are enough to reassemble.
*/
struct FileRecord {
  std::string filename;

  uint64_t size = 0;

  std::vector<std::string> urls;

  bool operator==(const FileRecord& other) const = default;
};

// Ordered by id so listings and exports are stable.
using RecordMap = std::map<FileId, FileRecord>;

} // namespace chunkvault::registry
