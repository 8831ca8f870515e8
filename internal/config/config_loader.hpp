#pragma once

#include <string>

#include "config/config.pb.h"

namespace todolist::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static todolist::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static todolist::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace todolist::config
