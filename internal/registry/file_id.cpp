#include "file_id.hpp"

#include <charconv>
#include <system_error>

#include "internal/util/errors.hpp"

namespace chunkvault::registry {

FileId ParseFileId(std::string_view text) {
  if (text.empty()) {
    throw util::InvalidArgument("file id must not be empty");
  }
  for (char c : text) {
    if (c < '0' || c > '9') {
      throw util::InvalidArgument("file id must be a decimal number: '" + std::string(text) + "'");
    }
  }

  FileId value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec == std::errc::result_out_of_range) {
    throw util::InvalidArgument("file id out of range: '" + std::string(text) + "'");
  }
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    throw util::InvalidArgument("file id must be a decimal number: '" + std::string(text) + "'");
  }
  if (value == 0) {
    throw util::InvalidArgument("file id must be positive");
  }
  return value;
}

std::string FormatFileId(FileId id) {
  return std::to_string(id);
}

} // namespace chunkvault::registry
