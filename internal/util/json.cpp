#include "json.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace datarouter::util {

namespace {

template <typename Message>
std::string Print(const Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode JSON: " + std::string(status.message()));
  }
  return json;
}

template <typename Message>
Message Parse(const std::string& json) {
  Message message;
  if (json.empty()) {
    return message;
  }
  auto status = google::protobuf::util::JsonStringToMessage(json, &message);
  if (!status.ok()) {
    throw std::runtime_error("Failed to decode JSON: " + std::string(status.message()));
  }
  return message;
}

} // namespace

std::string EncodeStringList(const std::vector<std::string>& values) {
  google::protobuf::ListValue list;
  for (const auto& value : values) {
    list.add_values()->set_string_value(value);
  }
  return Print(list);
}

std::vector<std::string> DecodeStringList(const std::string& json) {
  const auto               list = Parse<google::protobuf::ListValue>(json);
  std::vector<std::string> out;
  out.reserve(list.values_size());
  for (const auto& value : list.values()) {
    if (value.kind_case() != google::protobuf::Value::kStringValue) {
      throw std::runtime_error("Failed to decode JSON: expected string list element");
    }
    out.push_back(value.string_value());
  }
  return out;
}

std::string EncodeStringMap(const std::map<std::string, std::string>& values) {
  google::protobuf::Struct object;
  for (const auto& [key, value] : values) {
    (*object.mutable_fields())[key].set_string_value(value);
  }
  return Print(object);
}

std::map<std::string, std::string> DecodeStringMap(const std::string& json) {
  const auto                         object = Parse<google::protobuf::Struct>(json);
  std::map<std::string, std::string> out;
  for (const auto& [key, value] : object.fields()) {
    if (value.kind_case() != google::protobuf::Value::kStringValue) {
      throw std::runtime_error("Failed to decode JSON: expected string value for key " + key);
    }
    out.emplace(key, value.string_value());
  }
  return out;
}

std::string EncodeNumberMap(const std::map<std::string, double>& values) {
  google::protobuf::Struct object;
  for (const auto& [key, value] : values) {
    (*object.mutable_fields())[key].set_number_value(value);
  }
  return Print(object);
}

std::map<std::string, double> DecodeNumberMap(const std::string& json) {
  const auto                    object = Parse<google::protobuf::Struct>(json);
  std::map<std::string, double> out;
  for (const auto& [key, value] : object.fields()) {
    if (value.kind_case() != google::protobuf::Value::kNumberValue) {
      throw std::runtime_error("Failed to decode JSON: expected number value for key " + key);
    }
    out.emplace(key, value.number_value());
  }
  return out;
}

} // namespace datarouter::util
