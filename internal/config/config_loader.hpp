#pragma once

#include <string>

#include "config/config.pb.h"

namespace idsync::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected.
*/
class ConfigLoader {
 public:
  static idsync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static idsync::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);
};

} // namespace idsync::config
