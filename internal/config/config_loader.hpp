#pragma once

#include <string>

#include "config/config.pb.h"

namespace snapshot::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf. Environment
  overrides are applied after parsing, defaults are filled in last.
*/
class ConfigLoader {
 public:
  static snapshot::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static snapshot::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);

  // SNAPSHOT_START_CAMERA_WORKERS=0|1|true|false
  static void ApplyEnvironment(snapshot::runtime::config::RuntimeConfig& config);
  static void ApplyDefaults(snapshot::runtime::config::RuntimeConfig& config);
};

} // namespace snapshot::config
