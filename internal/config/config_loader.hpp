#pragma once

#include <string>

#include "config/config.pb.h"

namespace fieldsync::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so the .proto file
  is the single schema. Unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static fieldsync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static fieldsync::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace fieldsync::config
