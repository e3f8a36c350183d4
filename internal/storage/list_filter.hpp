#pragma once

#include <string>

#include "internal/model/content.hpp"
#include "internal/model/migration.hpp"
#include "backend_store.hpp"

namespace datarouter::storage {

inline constexpr const char* kDefaultContentType = "application/octet-stream";

// Builds the List() view of an item from its stored metadata.
ContentItem MakeContentItem(const std::string& content_id, std::uint64_t size_bytes, const model::Metadata& metadata);

bool MatchesFilter(const ContentItem& item, const model::ContentFilter& filter);

} // namespace datarouter::storage
