#pragma once

#include <string>

#include <google/protobuf/message.h>

#include "config/config.pb.h"

namespace fwbuild::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static fwbuild::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same YAML -> JSON -> protobuf path for any message (the catalog file uses it).
  static void LoadMessageFromYaml(const std::string& path, google::protobuf::Message* message);

  // Throws std::runtime_error naming the first missing required parameter.
  static void Validate(const fwbuild::runtime::config::RuntimeConfig& config);
};

} // namespace fwbuild::config
