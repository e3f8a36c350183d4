#pragma once

#include <cstdint>
#include <string_view>

namespace datarouter::model {

/*
  Shared priority scale for routing rules and migration tasks.
  Numerically higher values win.
*/
enum class Priority : std::int32_t {
  kLow      = 0,
  kNormal   = 1,
  kHigh     = 2,
  kCritical = 3,
};

constexpr bool IsValid(Priority priority) {
  const auto value = static_cast<std::int32_t>(priority);
  return value >= static_cast<std::int32_t>(Priority::kLow) && value <= static_cast<std::int32_t>(Priority::kCritical);
}

constexpr std::string_view ToString(Priority priority) {
  switch (priority) {
    case Priority::kLow:
      return "low";
    case Priority::kNormal:
      return "normal";
    case Priority::kHigh:
      return "high";
    case Priority::kCritical:
      return "critical";
  }
  return "invalid";
}

// Throws util::ValidationError on anything outside the enum set.
Priority ParsePriority(std::string_view value);
Priority PriorityFromInt(std::int64_t value);

} // namespace datarouter::model
