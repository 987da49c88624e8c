#pragma once

#include <string>

#include "config/config.pb.h"

namespace upgrader::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf, so the file takes
  the same field names as the proto JSON mapping. Unknown fields are
  rejected. Every failure is a ConfigurationError.
*/
class ConfigLoader {
 public:
  static upgrader::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static upgrader::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);
};

} // namespace upgrader::config
