#pragma once

#include <string>

#include "config/config.pb.h"

namespace sparkscope::config {

inline constexpr const char* kDefaultBindAddress         = "0.0.0.0:50051";
inline constexpr unsigned    kDefaultDiagnosticSampleMax = 20;

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so unknown keys are
  rejected the same way an unknown JSON field would be. Settings left out
  of the file take the built-in defaults.
*/
class ConfigLoader {
 public:
  static sparkscope::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Configuration used when no file is given.
  static sparkscope::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(sparkscope::runtime::config::RuntimeConfig& config);
};

} // namespace sparkscope::config
