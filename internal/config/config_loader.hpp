#pragma once

#include <string>

#include "config/config.pb.h"

namespace rollout::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Missing optional settings are filled by ApplyDefaults.
*/
class ConfigLoader {
 public:
  static rollout::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(rollout::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error on settings that cannot work together.
  static void Validate(const rollout::runtime::config::RuntimeConfig& config);
};

} // namespace rollout::config
