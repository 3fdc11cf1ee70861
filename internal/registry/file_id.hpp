#pragma once

#include <string>
#include <string_view>

#include "internal/registry/file_record.hpp"

namespace chunkvault::registry {

// Strict decimal parse. Throws util::InvalidArgument on anything else.
FileId ParseFileId(std::string_view text);

std::string FormatFileId(FileId id);

} // namespace chunkvault::registry
