#pragma once

#include <string>

#include "internal/registry/file_record.hpp"

namespace chunkvault::registry {

/*
  JSON registry document.

    {
      "<id>": {"filename": "<name>", "size": <bytes>, "urls": ["<url>", ...]},
      ...
    }

  The same format is used for the live registry and for exports.
*/

// Throws util::CorruptRegistry. Blank input is an empty document.
RecordMap ParseRegistryDocument(const std::string& json);

std::string SerializeRegistryDocument(const RecordMap& records);

} // namespace chunkvault::registry
