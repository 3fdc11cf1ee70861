#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <string>

namespace chunkvault::storage::common {

inline bool IsUsableFilename(const std::string& name) {
  if (name.empty() || name == "." || name == "..") {
    return false;
  }
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      return false;
    }
  }
  return true;
}

/*
  Reduce a stored display name to something safe to create inside a
  destination directory. Records may come from imported documents, so the
  name is never trusted as a path.
*/
inline std::string SafeFilename(const std::string& display_name, const std::string& fallback) {
  auto name = display_name;
  const auto slash = name.find_last_of("/\\");
  if (slash != std::string::npos) {
    name = name.substr(slash + 1);
  }
  return IsUsableFilename(name) ? name : fallback;
}

inline std::filesystem::path ChunkPath(const std::filesystem::path& root, uint64_t ordinal) {
  char name[40];
  std::snprintf(name, sizeof(name), "chunk-%06llu.part", static_cast<unsigned long long>(ordinal));
  return root / name;
}

} // namespace chunkvault::storage::common
