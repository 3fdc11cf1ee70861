#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace chunkvault::storage::common {

// std::nullopt if the file does not exist. Throws util::LocalIOError otherwise.
std::optional<std::string> ReadFileIfExists(const std::filesystem::path& path);

/*
  Atomic replace:
      write tmp → fsync → rename → fsync parent

  Readers see either the old or the new content, never a torn file.
*/
void WriteFileAtomic(const std::filesystem::path& path, std::string_view content);

/*
  Atomic create:
      write tmp → fsync → link (fails if target exists) → unlink tmp

  Returns false, leaving nothing behind, if `path` already exists.
*/
bool CreateFileExclusive(const std::filesystem::path& path, std::string_view content);

// Removes `path` if present. Never throws.
void RemoveQuietly(const std::filesystem::path& path) noexcept;

} // namespace chunkvault::storage::common
