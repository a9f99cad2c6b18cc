#pragma once

#include <string>

#include "config/config.pb.h"

namespace danmaku::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static danmaku::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same conversion for an in-memory document.
  static danmaku::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);
};

} // namespace danmaku::config
