#include "result.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace datarouter::db {

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
      throw util::ValidationError(message);
    case ErrorCode::ConstraintViolation:
      throw util::DuplicateTask(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace datarouter::db
