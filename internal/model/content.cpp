#include "content.hpp"

#include <array>
#include <cmath>

#include "internal/util/errors.hpp"

namespace datarouter::model {

std::optional<ContentCategory> ParseContentCategory(std::string_view value) {
  static constexpr std::array kAll = {
      ContentCategory::kBinary,  ContentCategory::kImage,   ContentCategory::kVideo,   ContentCategory::kAudio,
      ContentCategory::kDocument, ContentCategory::kArchive, ContentCategory::kDataset, ContentCategory::kModel,
  };
  for (auto category : kAll) {
    if (ToString(category) == value) {
      return category;
    }
  }
  return std::nullopt;
}

ContentCategory ParseContentCategoryOrThrow(std::string_view value) {
  if (auto category = ParseContentCategory(value)) {
    return *category;
  }
  throw util::ValidationError("unknown content category: " + std::string(value));
}

bool IsValid(const GeoPoint& point) {
  return std::isfinite(point.latitude) && std::isfinite(point.longitude) && std::abs(point.latitude) <= 90.0 &&
         std::abs(point.longitude) <= 180.0;
}

} // namespace datarouter::model
