#pragma once

#include <string>

#include "config/config.pb.h"

namespace mediaforge::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so durations are
  written the protobuf JSON way ("30s", "1.5s").
*/
class ConfigLoader {
 public:
  static mediaforge::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static mediaforge::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace mediaforge::config
