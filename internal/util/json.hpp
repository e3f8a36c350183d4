#pragma once

#include <map>
#include <string>
#include <vector>

namespace datarouter::util {

/*
  JSON text helpers for persisted collections.

  Encoding goes through google::protobuf::ListValue / Struct and the
  protobuf JSON printer so every repository backend stores the same text.
  Decoders throw std::runtime_error on malformed input.
*/

std::string              EncodeStringList(const std::vector<std::string>& values);
std::vector<std::string> DecodeStringList(const std::string& json);

std::string                        EncodeStringMap(const std::map<std::string, std::string>& values);
std::map<std::string, std::string> DecodeStringMap(const std::string& json);

std::string                   EncodeNumberMap(const std::map<std::string, double>& values);
std::map<std::string, double> DecodeNumberMap(const std::string& json);

} // namespace datarouter::util
