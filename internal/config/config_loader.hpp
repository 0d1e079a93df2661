#pragma once

#include <string>

#include "config/config.pb.h"

namespace jobhub::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Zero-valued tunables are replaced by their defaults.
*/
class ConfigLoader {
 public:
  static jobhub::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static jobhub::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(jobhub::runtime::config::RuntimeConfig& config);
};

} // namespace jobhub::config
