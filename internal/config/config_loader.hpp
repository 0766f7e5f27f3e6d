#pragma once

#include <string>

#include "config/config.pb.h"

namespace tracebrain::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf, so unknown keys and
  wrongly typed values are rejected by the protobuf JSON parser.
*/
class ConfigLoader {
 public:
  static tracebrain::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills defaults and rejects inconsistent settings.
  static void Normalize(tracebrain::runtime::config::RuntimeConfig* config);
};

} // namespace tracebrain::config
