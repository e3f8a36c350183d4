#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace datarouter::model {

// Caller-supplied metadata. Well-known keys: content_type, filename,
// size_bytes, content_category, content_id.
using Metadata = std::map<std::string, std::string>;

enum class ContentCategory : std::uint8_t {
  kBinary = 0,
  kImage,
  kVideo,
  kAudio,
  kDocument,
  kArchive,
  kDataset,
  kModel,
};

constexpr std::string_view ToString(ContentCategory category) {
  switch (category) {
    case ContentCategory::kImage:
      return "image";
    case ContentCategory::kVideo:
      return "video";
    case ContentCategory::kAudio:
      return "audio";
    case ContentCategory::kDocument:
      return "document";
    case ContentCategory::kArchive:
      return "archive";
    case ContentCategory::kDataset:
      return "dataset";
    case ContentCategory::kModel:
      return "model";
    case ContentCategory::kBinary:
    default:
      return "binary";
  }
}

std::optional<ContentCategory> ParseContentCategory(std::string_view value);

// Throws util::ValidationError on unknown names.
ContentCategory ParseContentCategoryOrThrow(std::string_view value);

struct GeoPoint {
  double latitude  = 0.0;
  double longitude = 0.0;
};

// Finite, latitude within [-90, 90] and longitude within [-180, 180].
bool IsValid(const GeoPoint& point);

/*
  Result of content analysis. Derived per routing call, never persisted.
*/
struct ContentDescriptor {
  std::uint64_t              size_bytes = 0;
  ContentCategory            category   = ContentCategory::kBinary;
  std::string                mime_type;
  std::optional<std::string> filename;
  std::string                extension;
  Metadata                   metadata;
};

} // namespace datarouter::model
