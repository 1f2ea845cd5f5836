#pragma once

#include <string>

#include "config/config.pb.h"

namespace YAML {
class Node;
}

namespace jobmeter::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected and durations are checked eagerly.
*/
class ConfigLoader {
 public:
  static jobmeter::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static jobmeter::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

 private:
  static jobmeter::runtime::config::RuntimeConfig FromNode(const YAML::Node& node);
  static void                                     Validate(const jobmeter::runtime::config::RuntimeConfig& config);
};

} // namespace jobmeter::config
