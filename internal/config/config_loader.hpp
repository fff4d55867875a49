#pragma once

#include <string>

#include "config/config.pb.h"

namespace demonlist::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Zero values are replaced by defaults (see ApplyDefaults).
*/
class ConfigLoader {
 public:
  static demonlist::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static demonlist::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  // memory backend, 4 workers, list sizes 75/150, page limits 50/100
  static void ApplyDefaults(demonlist::runtime::config::RuntimeConfig& config);
};

} // namespace demonlist::config
