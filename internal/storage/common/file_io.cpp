#include "file_io.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <atomic>
#include <system_error>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace chunkvault::storage::common {

namespace {

std::string ErrnoMessage(std::string_view action, const std::filesystem::path& target) {
  return std::string(action) + " " + target.filename().string() + " failed: " + std::strerror(errno);
}

void SyncPath(const std::filesystem::path& path, bool directory) {
  const int fd = ::open(path.c_str(), directory ? (O_RDONLY | O_DIRECTORY) : O_RDONLY);
  if (fd < 0) {
    throw util::LocalIOError(ErrnoMessage("open for sync", path));
  }
  const int rc = ::fsync(fd);
  const int saved_errno = errno;
  ::close(fd);
  if (rc != 0) {
    errno = saved_errno;
    throw util::LocalIOError(ErrnoMessage("fsync", path));
  }
}

std::filesystem::path ParentOf(const std::filesystem::path& path) {
  auto parent = path.parent_path();
  return parent.empty() ? std::filesystem::path(".") : parent;
}

// Unique per process and call so concurrent writers never share a tmp file.
std::filesystem::path TempSibling(const std::filesystem::path& path) {
  static std::atomic<uint64_t> counter{0};
  auto name = "." + path.filename().string() + ".tmp-" + std::to_string(::getpid()) + "-" + std::to_string(counter++);
  return ParentOf(path) / name;
}

void WriteAndSync(const std::filesystem::path& path, std::string_view content) {
  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(path.string()));
    Unwrap(out->Write(content.data(), static_cast<int64_t>(content.size())));
    Unwrap(out->Flush());
    Unwrap(out->Close());
  }
  SyncPath(path, false);
}

} // namespace

std::optional<std::string> ReadFileIfExists(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (ec) throw util::LocalIOError("stat " + path.filename().string() + " failed: " + ec.message());
    return std::nullopt;
  }

  auto file   = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  auto buffer = ReadAll(file);
  Unwrap(file->Close());
  return buffer->ToString();
}

void WriteFileAtomic(const std::filesystem::path& path, std::string_view content) {
  const auto tmp_path = TempSibling(path);
  try {
    WriteAndSync(tmp_path, content);
    std::filesystem::rename(tmp_path, path);
  } catch (const std::filesystem::filesystem_error& e) {
    RemoveQuietly(tmp_path);
    throw util::LocalIOError("replace " + path.filename().string() + " failed: " + e.code().message());
  } catch (...) {
    RemoveQuietly(tmp_path);
    throw;
  }
  SyncPath(ParentOf(path), true);
}

bool CreateFileExclusive(const std::filesystem::path& path, std::string_view content) {
  const auto tmp_path = TempSibling(path);
  try {
    WriteAndSync(tmp_path, content);
  } catch (...) {
    RemoveQuietly(tmp_path);
    throw;
  }

  const int rc          = ::link(tmp_path.c_str(), path.c_str());
  const int saved_errno = errno;
  RemoveQuietly(tmp_path);

  if (rc != 0) {
    if (saved_errno == EEXIST) {
      return false;
    }
    errno = saved_errno;
    throw util::LocalIOError(ErrnoMessage("create", path));
  }
  SyncPath(ParentOf(path), true);
  return true;
}

void RemoveQuietly(const std::filesystem::path& path) noexcept {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

} // namespace chunkvault::storage::common
