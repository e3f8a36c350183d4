#include "list_filter.hpp"

namespace datarouter::storage {

ContentItem MakeContentItem(const std::string& content_id, std::uint64_t size_bytes, const model::Metadata& metadata) {
  ContentItem item;
  item.content_id = content_id;
  item.size_bytes = size_bytes;
  item.metadata   = metadata;

  auto it           = metadata.find("content_type");
  item.content_type = it == metadata.end() || it->second.empty() ? kDefaultContentType : it->second;
  return item;
}

bool MatchesFilter(const ContentItem& item, const model::ContentFilter& filter) {
  if (filter.prefix && !item.content_id.starts_with(*filter.prefix)) return false;
  if (filter.type && !item.content_type.starts_with(*filter.type)) return false;
  if (filter.min_size_bytes && item.size_bytes < *filter.min_size_bytes) return false;
  if (filter.max_size_bytes && item.size_bytes > *filter.max_size_bytes) return false;

  for (const auto& [key, value] : filter.custom) {
    auto it = item.metadata.find(key);
    if (it == item.metadata.end() || it->second != value) return false;
  }
  return true;
}

} // namespace datarouter::storage
