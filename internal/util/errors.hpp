#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace datarouter::util {

/*
  Central error types.

  Core components throw these; the service layer translates them into
  structured results carrying an ErrorKind.
*/

enum class ErrorKind : std::uint8_t {
  kOk = 0,
  kValidation,
  kNotFound,
  kNoEligibleBackend,
  kDuplicateTask,
  kBackendUnavailable,
  kInvalidState,
  kInternal,
};

constexpr std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kOk:
      return "ok";
    case ErrorKind::kValidation:
      return "validation";
    case ErrorKind::kNotFound:
      return "not_found";
    case ErrorKind::kNoEligibleBackend:
      return "no_eligible_backend";
    case ErrorKind::kDuplicateTask:
      return "duplicate_task";
    case ErrorKind::kBackendUnavailable:
      return "backend_unavailable";
    case ErrorKind::kInvalidState:
      return "invalid_state";
    case ErrorKind::kInternal:
      return "internal";
  }
  return "internal";
}

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Candidate set empty after rule filtering.
class NoEligibleBackend : public std::runtime_error {
 public:
  explicit NoEligibleBackend(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DuplicateTask : public std::runtime_error {
 public:
  explicit DuplicateTask(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Store or fetch failure reported by a backend collaborator.
class BackendUnavailable : public std::runtime_error {
 public:
  explicit BackendUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace datarouter::util
