#pragma once

#include <string>

#include "config/config.pb.h"

namespace projsync::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected. The result is validated before it is returned.
*/
class ConfigLoader {
 public:
  static projsync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static projsync::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Throws util::InvalidArgument.
  static void Validate(const projsync::runtime::config::RuntimeConfig& config);
};

} // namespace projsync::config
