#pragma once

#include <string>

#include "config/config.pb.h"

namespace relay::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Missing tunables are filled with their defaults and the
  RELAY_SECRET_KEY environment variable overrides auth.secret_key.
*/
class ConfigLoader {
 public:
  static relay::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills unset durations and limits. Idempotent.
  static void ApplyDefaults(relay::runtime::config::RuntimeConfig& config);

  static void Validate(const relay::runtime::config::RuntimeConfig& config);
};

} // namespace relay::config
