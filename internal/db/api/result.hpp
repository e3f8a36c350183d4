#pragma once

#include <string>
#include <utility>

namespace datarouter::db {

/*
  Portable DB result codes.

  The repository layer translates backend errors into these.
  Upper layers never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Busy,

  // unique index on active (source, destination, content_id) tasks
  ConstraintViolation,

  IOError,
  Corruption,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

// Converts a failed Result into the matching util error; no-op on success.
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace datarouter::db
