#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <string>

#include "internal/util/errors.hpp"

namespace relay::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars carry the non-specific "!" tag and always stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw util::ConfigurationError("unsupported YAML node");
  }
}

namespace {

relay::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml, const std::string& origin) {
  relay::runtime::config::RuntimeConfig config;

  // an empty document means "all defaults"
  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw util::ConfigurationError("Invalid configuration: top level of " + origin + " must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::ConfigurationError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::ConfigurationError("Invalid configuration in " + origin + ": " + std::string(status.message()));
  }

  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loaders
// ------------------------------------------------------------

relay::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::ConfigurationError("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml, path);
}

relay::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw util::ConfigurationError("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml, "inline config");
}

} // namespace relay::config
