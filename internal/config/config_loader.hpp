#pragma once

#include <string>

#include "config/config.pb.h"

namespace datarouter::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Semantic checks (enum names, duplicate backends, coordinate
  ranges) run after parsing and raise util::ValidationError.
*/
class ConfigLoader {
 public:
  static datarouter::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static datarouter::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);

  static void Validate(const datarouter::runtime::config::RuntimeConfig& config);
};

} // namespace datarouter::config
