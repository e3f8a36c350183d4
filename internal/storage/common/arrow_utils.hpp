#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>

#include <filesystem>
#include <memory>
#include <string>

#include "internal/util/errors.hpp"

namespace datarouter::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw util::BackendUnavailable
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw util::BackendUnavailable(result.status().ToString());
  return result.MoveValueUnsafe();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw util::BackendUnavailable(status.ToString());
}

// Copies bytes into a freshly allocated Arrow buffer.
std::shared_ptr<arrow::Buffer> ToBuffer(const std::string& bytes);

std::string ToBytes(const arrow::Buffer& buffer);

/*
  Read entire file into buffer
*/
std::shared_ptr<arrow::Buffer> ReadFile(const std::filesystem::path& path);

/*
  Atomic write:
      write tmp -> flush -> rename
*/
void WriteFileAtomic(const std::filesystem::path& path, const std::string& bytes, bool fsync);

} // namespace datarouter::storage::common
