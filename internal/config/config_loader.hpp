#pragma once

#include <string>

#include "config/config.pb.h"

namespace assetdb::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static assetdb::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same conversion for YAML held in memory.
  static assetdb::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);
};

} // namespace assetdb::config
