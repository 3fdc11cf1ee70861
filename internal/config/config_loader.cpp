#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace chunkvault::config {

using chunkvault::runtime::config::ID_STRATEGY_RANDOM;
using chunkvault::runtime::config::ID_STRATEGY_UNSPECIFIED;
using chunkvault::runtime::config::RuntimeConfig;

namespace {

constexpr uint64_t kDefaultChunkSizeBytes      = 24'000'000;
constexpr uint64_t kDefaultMaxId               = 99'999'999;
constexpr uint32_t kDefaultDownloadConcurrency = 8;

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  // an empty file is a valid, all-defaults config
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(&config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50061");

  auto* registry = config->mutable_registry();
  if (registry->path().empty()) registry->set_path("files_cache.json");

  auto* ids = config->mutable_ids();
  if (ids->strategy() == ID_STRATEGY_UNSPECIFIED) ids->set_strategy(ID_STRATEGY_RANDOM);
  if (ids->min_id() == 0) ids->set_min_id(1);
  if (ids->max_id() == 0) ids->set_max_id(kDefaultMaxId);
  if (ids->max_random_attempts() == 0) ids->set_max_random_attempts(64);

  auto* endpoints = config->mutable_endpoints();
  if (endpoints->username().empty()) endpoints->set_username("chunkvault");

  auto* transfer = config->mutable_transfer();
  if (transfer->chunk_size_bytes() == 0) transfer->set_chunk_size_bytes(kDefaultChunkSizeBytes);
  if (transfer->upload_batch_size() == 0) transfer->set_upload_batch_size(4);
  if (!transfer->has_download_concurrency()) transfer->set_download_concurrency(kDefaultDownloadConcurrency);
  if (transfer->connect_timeout_ms() == 0) transfer->set_connect_timeout_ms(10'000);
  if (transfer->request_timeout_ms() == 0) transfer->set_request_timeout_ms(120'000);

  auto* retry = transfer->mutable_retry();
  if (retry->max_attempts() == 0) retry->set_max_attempts(3);
  if (retry->initial_backoff_ms() == 0) retry->set_initial_backoff_ms(500);
  if (retry->max_backoff_ms() == 0) retry->set_max_backoff_ms(8'000);
  if (retry->backoff_multiplier() <= 0.0) retry->set_backoff_multiplier(2.0);

  auto* storage = config->mutable_storage();
  if (storage->work_dir().empty()) storage->set_work_dir("./chunkvault-work");
  if (storage->download_dir().empty()) storage->set_download_dir("./downloads");
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.transfer().chunk_size_bytes() == 0) {
    throw util::InvalidArgument("transfer.chunk_size_bytes must be > 0");
  }
  if (config.ids().min_id() == 0) {
    throw util::InvalidArgument("ids.min_id must be > 0");
  }
  if (config.ids().min_id() > config.ids().max_id()) {
    throw util::InvalidArgument("ids.min_id must not exceed ids.max_id");
  }
}

} // namespace chunkvault::config
