#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <unordered_set>

#include "internal/model/content.hpp"
#include "internal/model/priority.hpp"
#include "internal/model/routing.hpp"
#include "internal/util/errors.hpp"

namespace datarouter::config {

using datarouter::runtime::config::RuntimeConfig;

namespace {

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
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
  if (!scalar_value.empty() && endptr && *endptr == '\0' && std::isfinite(numeric_value)) {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
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
      throw std::runtime_error("Unsupported YAML node");
  }
}

RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;

  // empty document -> all defaults
  if (!yaml || yaml.IsNull()) {
    ConfigLoader::Validate(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top-level YAML node must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (!config.routing().default_strategy().empty()) {
    model::ParseStrategy(config.routing().default_strategy());
  }
  if (!config.routing().default_priority().empty()) {
    model::ParsePriority(config.routing().default_priority());
  }

  for (const auto& region : config.regions()) {
    if (region.name().empty()) {
      throw util::ValidationError("region name must not be empty");
    }
    if (!model::IsValid(model::GeoPoint{region.latitude(), region.longitude()})) {
      throw util::ValidationError("region " + region.name() + ": coordinates out of range");
    }
  }

  std::unordered_set<std::string> names;
  for (const auto& backend : config.backends()) {
    if (backend.name().empty()) {
      throw util::ValidationError("backend name must not be empty");
    }
    if (!names.insert(backend.name()).second) {
      throw util::ValidationError("duplicate backend name: " + backend.name());
    }
    if (backend.has_disk() && backend.disk().root_path().empty()) {
      throw util::ValidationError("backend " + backend.name() + ": disk store requires root_path");
    }
    if (backend.profile().has_latitude() != backend.profile().has_longitude()) {
      throw util::ValidationError("backend " + backend.name() + ": latitude and longitude must be set together");
    }
    if (backend.profile().has_latitude() &&
        !model::IsValid(model::GeoPoint{backend.profile().latitude(), backend.profile().longitude()})) {
      throw util::ValidationError("backend " + backend.name() + ": coordinates out of range");
    }
  }
}

} // namespace datarouter::config
