#include "migration.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace datarouter::model {

MigrationStatus ParseStatus(std::string_view value) {
  for (auto status : kAllStatuses) {
    if (ToString(status) == value) {
      return status;
    }
  }
  throw util::ValidationError("unknown migration status: " + std::string(value));
}

MigrationStatus StatusFromInt(std::int64_t value) {
  if (value < 0 || value > static_cast<std::int64_t>(MigrationStatus::kCancelled)) {
    throw std::runtime_error("corrupt migration status: " + std::to_string(value));
  }
  return static_cast<MigrationStatus>(value);
}

ScheduleMode ParseScheduleMode(std::string_view value) {
  if (value.empty() || value == "manual") {
    return ScheduleMode::kManual;
  }
  if (value == "periodic") {
    return ScheduleMode::kPeriodic;
  }
  throw util::ValidationError("unknown schedule mode: " + std::string(value));
}

} // namespace datarouter::model
