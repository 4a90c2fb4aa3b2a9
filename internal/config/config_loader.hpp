#pragma once

#include <string>

#include "config/config.pb.h"

namespace foreman::config {

/*
  Loads RuntimeConfig from YAML.

  The YAML tree is converted to a protobuf Value, rendered as JSON and parsed
  into the config message. Unknown keys are rejected so typos fail loudly.
  Zero / empty fields are then filled with the daemon defaults.
*/
class ConfigLoader {
 public:
  static foreman::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same as LoadFromYaml but from an in-memory document.
  static foreman::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);

  static void ApplyDefaults(foreman::runtime::config::RuntimeConfig& config);
};

} // namespace foreman::config
