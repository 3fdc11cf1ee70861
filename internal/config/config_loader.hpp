#pragma once

#include <string>

#include "config/config.pb.h"

namespace chunkvault::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unset fields are filled by ApplyDefaults before the config is returned.
*/
class ConfigLoader {
 public:
  static chunkvault::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(chunkvault::runtime::config::RuntimeConfig* config);

  // Throws util::InvalidArgument for values no component can run with.
  static void Validate(const chunkvault::runtime::config::RuntimeConfig& config);
};

} // namespace chunkvault::config
