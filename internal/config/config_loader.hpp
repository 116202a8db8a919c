#pragma once

#include <string>

#include "config/config.pb.h"

namespace pokertable::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static pokertable::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static pokertable::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace pokertable::config
