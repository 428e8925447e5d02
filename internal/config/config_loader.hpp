#pragma once

#include <string>

#include "config/config.pb.h"
#include "depgraph/registry/core/v1/interface.pb.h"

namespace depgraph::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Failures throw std::runtime_error.
*/
class ConfigLoader {
 public:
  static depgraph::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static depgraph::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);

  // Interface description document (proto JSON mapping).
  // Throws util::MalformedInterface on parse failure.
  static depgraph::registry::core::v1::InterfaceDescription LoadInterfaceFromJson(const std::string& json);
};

} // namespace depgraph::config
