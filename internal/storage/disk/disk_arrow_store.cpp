#include "disk_arrow_store.hpp"

#include <algorithm>
#include <mutex>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/list_filter.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/uuid.hpp"

namespace datarouter::storage {

using namespace datarouter::storage::common;

DiskArrowStore::DiskArrowStore(std::string name, std::filesystem::path root, bool fsync)
    : name_(std::move(name)), root_(std::move(root)), fsync_(fsync) {
  std::filesystem::create_directories(root_);
}

std::string DiskArrowStore::Add(const std::string& content, const model::Metadata& metadata) {
  auto        it = metadata.find("content_id");
  std::string id = it != metadata.end() && !it->second.empty() ? it->second : util::GenerateId();

  const auto content_path  = ContentPath(root_, id);
  const auto metadata_path = MetadataPath(root_, id);

  std::unique_lock lock(mutex_);
  // sidecar first: a .bin without metadata is never listed half-written
  WriteFileAtomic(metadata_path, util::EncodeStringMap(metadata), fsync_);
  WriteFileAtomic(content_path, content, fsync_);
  return id;
}

std::string DiskArrowStore::Get(const std::string& content_id) {
  const auto path = ContentPath(root_, content_id);

  std::shared_lock lock(mutex_);
  if (!std::filesystem::exists(path)) throw util::NotFound(name_ + ": content not found: " + content_id);
  return ToBytes(*ReadFile(path));
}

model::Metadata DiskArrowStore::GetMetadata(const std::string& content_id) {
  std::shared_lock lock(mutex_);
  if (!std::filesystem::exists(ContentPath(root_, content_id))) {
    throw util::NotFound(name_ + ": content not found: " + content_id);
  }
  return ReadMetadataLocked(content_id);
}

ContentItem DiskArrowStore::Describe(const std::string& content_id) {
  const auto path = ContentPath(root_, content_id);

  std::shared_lock lock(mutex_);
  std::error_code  ec;
  const auto       size = std::filesystem::file_size(path, ec);
  if (ec == std::errc::no_such_file_or_directory) throw util::NotFound(name_ + ": content not found: " + content_id);
  if (ec) throw util::BackendUnavailable(name_ + ": stat " + content_id + ": " + ec.message());
  return MakeContentItem(content_id, static_cast<std::uint64_t>(size), ReadMetadataLocked(content_id));
}

model::Metadata DiskArrowStore::ReadMetadataLocked(const std::string& content_id) const {
  const auto path = MetadataPath(root_, content_id);
  if (!std::filesystem::exists(path)) return {};
  try {
    return util::DecodeStringMap(ToBytes(*ReadFile(path)));
  } catch (const util::BackendUnavailable&) {
    throw;
  } catch (const std::runtime_error& e) {
    throw util::BackendUnavailable(name_ + ": corrupt metadata for " + content_id + ": " + e.what());
  }
}

std::vector<ContentItem> DiskArrowStore::List(const model::ContentFilter& filter) {
  std::shared_lock         lock(mutex_);
  std::vector<ContentItem> out;

  const std::string suffix = kContentSuffix;
  for (const auto& entry : std::filesystem::directory_iterator(root_)) {
    if (!entry.is_regular_file()) continue;
    const auto file_name = entry.path().filename().string();
    if (file_name.size() <= suffix.size() || !file_name.ends_with(suffix)) continue;

    const auto id   = file_name.substr(0, file_name.size() - suffix.size());
    auto       item = MakeContentItem(id, static_cast<std::uint64_t>(entry.file_size()), ReadMetadataLocked(id));
    if (MatchesFilter(item, filter)) out.push_back(std::move(item));
  }

  std::sort(out.begin(), out.end(), [](const ContentItem& a, const ContentItem& b) { return a.content_id < b.content_id; });
  return out;
}

bool DiskArrowStore::Delete(const std::string& content_id) {
  const auto content_path  = ContentPath(root_, content_id);
  const auto metadata_path = MetadataPath(root_, content_id);

  std::unique_lock lock(mutex_);
  std::error_code  ec;
  const bool       removed = std::filesystem::remove(content_path, ec);
  if (ec) throw util::BackendUnavailable(name_ + ": delete " + content_id + ": " + ec.message());
  std::filesystem::remove(metadata_path, ec);
  if (ec) {
    DATAROUTER_LOG_WARN("Metadata sidecar not removed",
                        {observability::StringField("backend", name_), observability::StringField("content_id", content_id),
                         observability::StringField("error", ec.message())});
  }
  return removed;
}

} // namespace datarouter::storage
