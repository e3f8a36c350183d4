#pragma once

#include <filesystem>
#include <shared_mutex>
#include <string>

#include "internal/storage/backend_store.hpp"

namespace datarouter::storage {

/*
  Durable disk storage using Arrow IO.

  Layout under root:
    <content_id>.bin        bytes
    <content_id>.meta.json  metadata as a JSON object

  Properties:
    - atomic replace writes (tmp + rename)
    - optional fsync
*/
class DiskArrowStore final : public BackendStore {
 public:
  DiskArrowStore(std::string name, std::filesystem::path root, bool fsync);

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
  model::Metadata ReadMetadataLocked(const std::string& content_id) const;

  std::string               name_;
  std::filesystem::path     root_;
  bool                      fsync_;
  mutable std::shared_mutex mutex_;
};

} // namespace datarouter::storage
