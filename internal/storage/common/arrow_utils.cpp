#include "arrow_utils.hpp"

#include <arrow/memory_pool.h>

#include <cstring>
#include <system_error>

namespace datarouter::storage::common {

std::shared_ptr<arrow::Buffer> ToBuffer(const std::string& bytes) {
  std::shared_ptr<arrow::Buffer> buffer = Unwrap(arrow::AllocateBuffer(static_cast<int64_t>(bytes.size())));
  if (!bytes.empty()) {
    std::memcpy(buffer->mutable_data(), bytes.data(), bytes.size());
  }
  return buffer;
}

std::string ToBytes(const arrow::Buffer& buffer) {
  return std::string(reinterpret_cast<const char*>(buffer.data()), static_cast<std::size_t>(buffer.size()));
}

std::shared_ptr<arrow::Buffer> ReadFile(const std::filesystem::path& path) {
  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  auto size = Unwrap(file->GetSize());
  auto data = Unwrap(file->Read(size));
  Unwrap(file->Close());
  return data;
}

void WriteFileAtomic(const std::filesystem::path& path, const std::string& bytes, bool fsync) {
  const auto tmp_path = path.string() + ".tmp";

  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
    Unwrap(out->Write(bytes.data(), static_cast<int64_t>(bytes.size())));
    if (fsync) Unwrap(out->Flush());
    Unwrap(out->Close());
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::filesystem::remove(tmp_path, ec);
    throw util::BackendUnavailable("rename " + tmp_path + ": failed");
  }
}

} // namespace datarouter::storage::common
