#pragma once

#include <string>

#include "config/config.pb.h"

namespace relay::config {

/*
  Reads the relay's YAML config into RuntimeConfig.

  The YAML tree goes through google::protobuf::Value and JSON so protobuf's
  own parser enforces the schema: unknown keys and type mismatches fail.
  Quoted scalars always stay strings. An empty file yields an all-default
  config; value ranges are checked later by ResolveSettings().

  Every failure is util::ConfigurationError.
*/
class ConfigLoader {
 public:
  static relay::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static relay::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);
};

} // namespace relay::config
