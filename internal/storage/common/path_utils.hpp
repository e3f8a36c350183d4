#pragma once

#include <filesystem>
#include <string>

#include "internal/util/errors.hpp"

namespace datarouter::storage::common {

inline constexpr const char* kContentSuffix  = ".bin";
inline constexpr const char* kMetadataSuffix = ".meta.json";

inline void ValidateContentId(const std::string& content_id) {
  if (content_id.empty()) {
    throw util::ValidationError("content id must not be empty");
  }
  for (char c : content_id) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw util::ValidationError("content id contains invalid character");
    }
  }
  if (content_id == "." || content_id == "..") {
    throw util::ValidationError("content id must not be a relative path component");
  }
}

inline std::filesystem::path ContentPath(const std::filesystem::path& root, const std::string& content_id) {
  ValidateContentId(content_id);
  return root / (content_id + kContentSuffix);
}

inline std::filesystem::path MetadataPath(const std::filesystem::path& root, const std::string& content_id) {
  ValidateContentId(content_id);
  return root / (content_id + kMetadataSuffix);
}

} // namespace datarouter::storage::common
