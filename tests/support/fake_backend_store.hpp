#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/storage/backend_store.hpp"
#include "internal/storage/list_filter.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace datarouter::testing {

/*
  In-process BackendStore with fault injection for tests.
*/
class FakeBackendStore final : public storage::BackendStore {
 public:
  explicit FakeBackendStore(std::string name) : name_(std::move(name)) {
  }

  std::string Add(const std::string& content, const model::Metadata& metadata) override {
    if (fail_adds > 0) {
      --fail_adds;
      throw util::BackendUnavailable(name_ + ": add failed");
    }
    std::lock_guard lock(mutex_);
    auto            it = metadata.find("content_id");
    std::string     id = it != metadata.end() && !it->second.empty() ? it->second : util::GenerateId();
    items_[id]         = Item{corrupt_adds ? content + "!" : content, metadata};
    ++adds;
    return id;
  }

  std::string Get(const std::string& content_id) override {
    if (fail_gets > 0) {
      --fail_gets;
      throw util::BackendUnavailable(name_ + ": get failed");
    }
    std::lock_guard lock(mutex_);
    auto            it = items_.find(content_id);
    if (it == items_.end()) throw util::NotFound(name_ + ": content not found: " + content_id);
    ++gets;
    return it->second.content;
  }

  model::Metadata GetMetadata(const std::string& content_id) override {
    std::lock_guard lock(mutex_);
    auto            it = items_.find(content_id);
    if (it == items_.end()) throw util::NotFound(name_ + ": content not found: " + content_id);
    return it->second.metadata;
  }

  storage::ContentItem Describe(const std::string& content_id) override {
    std::lock_guard lock(mutex_);
    auto            it = items_.find(content_id);
    if (it == items_.end()) throw util::NotFound(name_ + ": content not found: " + content_id);
    return storage::MakeContentItem(content_id, it->second.content.size(), it->second.metadata);
  }

  std::vector<storage::ContentItem> List(const model::ContentFilter& filter) override {
    std::lock_guard                   lock(mutex_);
    std::vector<storage::ContentItem> out;
    for (const auto& [id, item] : items_) {
      auto view = storage::MakeContentItem(id, item.content.size(), item.metadata);
      if (storage::MatchesFilter(view, filter)) out.push_back(std::move(view));
    }
    return out;
  }

  bool Delete(const std::string& content_id) override {
    if (fail_deletes) throw util::BackendUnavailable(name_ + ": delete failed");
    std::lock_guard lock(mutex_);
    return items_.erase(content_id) > 0;
  }

  const std::string& Name() const override {
    return name_;
  }

  // Seeds an item directly, bypassing fault injection.
  void Put(const std::string& id, const std::string& content, model::Metadata metadata = {}) {
    std::lock_guard lock(mutex_);
    items_[id] = Item{content, std::move(metadata)};
  }

  bool Has(const std::string& id) {
    std::lock_guard lock(mutex_);
    return items_.count(id) > 0;
  }

  model::Metadata MetadataOf(const std::string& id) {
    std::lock_guard lock(mutex_);
    return items_.at(id).metadata;
  }

  std::atomic<int>  fail_adds{0};
  std::atomic<int>  fail_gets{0};
  std::atomic<bool> fail_deletes{false};
  std::atomic<bool> corrupt_adds{false};
  std::atomic<int>  adds{0};
  std::atomic<int>  gets{0};

 private:
  struct Item {
    std::string     content;
    model::Metadata metadata;
  };

  std::string                 name_;
  std::mutex                  mutex_;
  std::map<std::string, Item> items_;
};

} // namespace datarouter::testing
