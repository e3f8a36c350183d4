#include "error_kind.hpp"

namespace datarouter::util {

ErrorKind KindOf(const std::exception& e) {
  if (dynamic_cast<const ValidationError*>(&e)) {
    return ErrorKind::kValidation;
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return ErrorKind::kNotFound;
  }
  if (dynamic_cast<const NoEligibleBackend*>(&e)) {
    return ErrorKind::kNoEligibleBackend;
  }
  if (dynamic_cast<const DuplicateTask*>(&e)) {
    return ErrorKind::kDuplicateTask;
  }
  if (dynamic_cast<const BackendUnavailable*>(&e)) {
    return ErrorKind::kBackendUnavailable;
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return ErrorKind::kInvalidState;
  }

  return ErrorKind::kInternal;
}

} // namespace datarouter::util
