#include "priority.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace datarouter::model {

Priority ParsePriority(std::string_view value) {
  for (auto priority : {Priority::kLow, Priority::kNormal, Priority::kHigh, Priority::kCritical}) {
    if (ToString(priority) == value) {
      return priority;
    }
  }
  throw util::ValidationError("unknown priority: " + std::string(value));
}

Priority PriorityFromInt(std::int64_t value) {
  if (value < static_cast<std::int64_t>(Priority::kLow) || value > static_cast<std::int64_t>(Priority::kCritical)) {
    throw util::ValidationError("priority out of range: " + std::to_string(value));
  }
  return static_cast<Priority>(value);
}

} // namespace datarouter::model
