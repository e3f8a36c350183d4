#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/content.hpp"
#include "internal/model/migration.hpp"

namespace datarouter::storage {

/*
  One stored item as reported by List().
*/
struct ContentItem {
  std::string     content_id;
  std::uint64_t   size_bytes = 0;
  std::string     content_type;
  model::Metadata metadata;
};

/*
  Backend store abstraction.

  Content is an opaque byte string; the router never looks inside.

  Errors:
    Get / GetMetadata / Describe on an unknown id -> util::NotFound
    I/O or remote failures                       -> util::BackendUnavailable

  Implementations:
    RAM   -> Arrow buffers held in process
    DISK  -> one file per item plus a JSON metadata sidecar
*/
class BackendStore {
 public:
  virtual ~BackendStore() = default;

  // Stores bytes and returns the content id. Honours metadata["content_id"]
  // when present, otherwise generates one.
  virtual std::string Add(const std::string& content, const model::Metadata& metadata) = 0;

  virtual std::string Get(const std::string& content_id) = 0;

  virtual model::Metadata GetMetadata(const std::string& content_id) = 0;

  // Size, content type and metadata of one item without reading its bytes.
  virtual ContentItem Describe(const std::string& content_id) = 0;

  // Items matching every set field of the filter, ordered by content id.
  virtual std::vector<ContentItem> List(const model::ContentFilter& filter) = 0;

  // False when nothing was stored under the id.
  virtual bool Delete(const std::string& content_id) = 0;

  virtual const std::string& Name() const = 0;
};

using BackendStorePtr = std::shared_ptr<BackendStore>;

} // namespace datarouter::storage
