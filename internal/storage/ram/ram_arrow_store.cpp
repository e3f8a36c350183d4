#include "ram_arrow_store.hpp"

#include <mutex>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/list_filter.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace datarouter::storage {

RamArrowStore::RamArrowStore(std::string name) : name_(std::move(name)) {
}

std::string RamArrowStore::Add(const std::string& content, const model::Metadata& metadata) {
  auto        it = metadata.find("content_id");
  std::string id = it != metadata.end() && !it->second.empty() ? it->second : util::GenerateId();

  Entry entry{common::ToBuffer(content), metadata};

  std::unique_lock lock(mutex_);
  entries_[id] = std::move(entry);
  return id;
}

/*
  Zero-copy lookup; bytes are copied out for the caller.
*/
std::string RamArrowStore::Get(const std::string& content_id) {
  std::shared_ptr<arrow::Buffer> buffer;
  {
    std::shared_lock lock(mutex_);
    auto             it = entries_.find(content_id);
    if (it == entries_.end()) throw util::NotFound(name_ + ": content not found: " + content_id);
    buffer = it->second.buffer;
  }
  return common::ToBytes(*buffer);
}

model::Metadata RamArrowStore::GetMetadata(const std::string& content_id) {
  std::shared_lock lock(mutex_);
  auto             it = entries_.find(content_id);
  if (it == entries_.end()) throw util::NotFound(name_ + ": content not found: " + content_id);
  return it->second.metadata;
}

ContentItem RamArrowStore::Describe(const std::string& content_id) {
  std::shared_lock lock(mutex_);
  auto             it = entries_.find(content_id);
  if (it == entries_.end()) throw util::NotFound(name_ + ": content not found: " + content_id);
  return MakeContentItem(content_id, static_cast<std::uint64_t>(it->second.buffer->size()), it->second.metadata);
}

std::vector<ContentItem> RamArrowStore::List(const model::ContentFilter& filter) {
  std::shared_lock         lock(mutex_);
  std::vector<ContentItem> out;
  for (const auto& [id, entry] : entries_) {
    auto item = MakeContentItem(id, static_cast<std::uint64_t>(entry.buffer->size()), entry.metadata);
    if (MatchesFilter(item, filter)) out.push_back(std::move(item));
  }
  return out;
}

bool RamArrowStore::Delete(const std::string& content_id) {
  std::unique_lock lock(mutex_);
  return entries_.erase(content_id) > 0;
}

} // namespace datarouter::storage
