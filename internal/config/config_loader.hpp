#pragma once

#include <string>

#include "config/config.pb.h"

namespace dispatch::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Unset fields are filled from the built-in defaults and the
  result is validated before it is returned.
*/
class ConfigLoader {
 public:
  static dispatch::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static dispatch::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  // Fills zero-valued fields with defaults. Idempotent.
  static void ApplyDefaults(dispatch::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error describing the first invalid field.
  static void Validate(const dispatch::runtime::config::RuntimeConfig& config);
};

} // namespace dispatch::config
