#pragma once

#include <string>

#include "config/config.pb.h"

namespace refinery::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected so a typo in a section name fails loudly at startup.
*/
class ConfigLoader {
 public:
  static refinery::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static refinery::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);
};

} // namespace refinery::config
