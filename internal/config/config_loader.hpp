#pragma once

#include <string>

#include "config/config.pb.h"

namespace photosift::config {

/*
  Reads photosift YAML into RuntimeConfig.

  Unknown keys are rejected. Missing keys keep their proto defaults;
  SettingsFromConfig turns those into the engine defaults and validates
  the values. Every failure is a std::runtime_error naming the source.
*/
class ConfigLoader {
 public:
  static photosift::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // YAML held in memory; "" yields an all-default config.
  static photosift::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);
};

} // namespace photosift::config
