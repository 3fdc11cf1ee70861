#include "registry_document.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <cstdint>

#include "internal/registry/file_id.hpp"
#include "internal/util/errors.hpp"

namespace chunkvault::registry {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

// Largest integer a JSON number (IEEE double) holds exactly.
constexpr uint64_t kMaxExactSize = uint64_t{1} << 53;

[[noreturn]] void Corrupt(const std::string& key, const std::string& what) {
  throw util::CorruptRegistry("entry '" + key + "': " + what);
}

bool IsBlank(const std::string& text) {
  for (char c : text) {
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') return false;
  }
  return true;
}

const Value& RequireField(const Struct& entry, const std::string& key, const char* field) {
  auto it = entry.fields().find(field);
  if (it == entry.fields().end()) {
    Corrupt(key, std::string("missing field '") + field + "'");
  }
  return it->second;
}

FileRecord ToRecord(const std::string& key, const Value& value) {
  if (value.kind_case() != Value::kStructValue) {
    Corrupt(key, "not an object");
  }
  const auto& entry = value.struct_value();

  FileRecord record;

  const auto& filename = RequireField(entry, key, "filename");
  if (filename.kind_case() != Value::kStringValue) {
    Corrupt(key, "filename is not a string");
  }
  record.filename = filename.string_value();

  const auto& size = RequireField(entry, key, "size");
  if (size.kind_case() != Value::kNumberValue) {
    Corrupt(key, "size is not a number");
  }
  const double number = size.number_value();
  if (number < 0 || std::floor(number) != number || number > static_cast<double>(kMaxExactSize)) {
    Corrupt(key, "size is not a non-negative integer");
  }
  record.size = static_cast<uint64_t>(number);

  const auto& urls = RequireField(entry, key, "urls");
  if (urls.kind_case() != Value::kListValue) {
    Corrupt(key, "urls is not an array");
  }
  for (const auto& url : urls.list_value().values()) {
    if (url.kind_case() != Value::kStringValue || url.string_value().empty()) {
      Corrupt(key, "urls must hold non-empty strings");
    }
    record.urls.push_back(url.string_value());
  }

  if ((record.size == 0) != record.urls.empty()) {
    Corrupt(key, "size and chunk count disagree");
  }
  if (record.urls.size() > record.size) {
    Corrupt(key, "more chunks than bytes");
  }
  return record;
}

} // namespace

RecordMap ParseRegistryDocument(const std::string& json) {
  RecordMap records;
  if (IsBlank(json)) {
    return records;
  }

  Struct document;
  auto   status = google::protobuf::util::JsonStringToMessage(json, &document);
  if (!status.ok()) {
    throw util::CorruptRegistry("registry document is not a JSON object: " + std::string(status.message()));
  }

  for (const auto& [key, value] : document.fields()) {
    FileId id = 0;
    try {
      id = ParseFileId(key);
    } catch (const util::InvalidArgument& e) {
      Corrupt(key, e.what());
    }
    records[id] = ToRecord(key, value);
  }
  return records;
}

std::string SerializeRegistryDocument(const RecordMap& records) {
  Struct document;
  for (const auto& [id, record] : records) {
    if (record.size > kMaxExactSize) {
      throw util::InvalidArgument("file " + FormatFileId(id) + " is too large to record");
    }

    Struct entry;
    (*entry.mutable_fields())["filename"].set_string_value(record.filename);
    (*entry.mutable_fields())["size"].set_number_value(static_cast<double>(record.size));
    auto* urls = (*entry.mutable_fields())["urls"].mutable_list_value();
    for (const auto& url : record.urls) {
      urls->add_values()->set_string_value(url);
    }

    *(*document.mutable_fields())[FormatFileId(id)].mutable_struct_value() = std::move(entry);
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(document, &json, options);
  if (!status.ok()) {
    throw util::RegistryError("cannot serialize registry: " + std::string(status.message()));
  }
  return json;
}

} // namespace chunkvault::registry
