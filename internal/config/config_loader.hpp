#pragma once

#include <string>

#include "config/config.pb.h"

namespace statecore::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown fields
  are rejected.
*/
class ConfigLoader {
 public:
  static statecore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static statecore::runtime::config::RuntimeConfig ParseYaml(const std::string& yaml_text);
};

} // namespace statecore::config
