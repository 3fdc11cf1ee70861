#pragma once

#include <filesystem>
#include <string>

namespace chunkvault::storage {

/*
  Per-operation scratch directory.

  Created under the configured work directory with a unique name and removed
  recursively when the object is destroyed, whatever the exit path.
*/
class ScratchSpace {
 public:
  ScratchSpace(const std::filesystem::path& work_dir, const std::string& prefix);
  ~ScratchSpace();

  ScratchSpace(const ScratchSpace&)            = delete;
  ScratchSpace& operator=(const ScratchSpace&) = delete;

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

} // namespace chunkvault::storage
