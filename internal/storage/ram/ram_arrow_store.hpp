#pragma once

#include <arrow/buffer.h>

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>

#include "internal/storage/backend_store.hpp"

namespace datarouter::storage {

/*
  In-process backend store.

  Backed by Arrow buffers held in memory; nothing survives the process.

  Thread safety:
    - shared reads
    - exclusive writes
*/
class RamArrowStore final : public BackendStore {
 public:
  explicit RamArrowStore(std::string name);

  std::string              Add(const std::string& content, const model::Metadata& metadata) override;
  std::string              Get(const std::string& content_id) override;
  model::Metadata          GetMetadata(const std::string& content_id) override;
  ContentItem              Describe(const std::string& content_id) override;
  std::vector<ContentItem> List(const model::ContentFilter& filter) override;
  bool                     Delete(const std::string& content_id) override;

  const std::string& Name() const override {
    return name_;
  }

 private:
  struct Entry {
    std::shared_ptr<arrow::Buffer> buffer;
    model::Metadata                metadata;
  };

  std::string                  name_;
  mutable std::shared_mutex    mutex_;
  std::map<std::string, Entry> entries_;
};

} // namespace datarouter::storage
