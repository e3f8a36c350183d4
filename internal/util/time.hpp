#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace datarouter::util {

/*
  Time utilities. All clock reads go through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// RFC3339 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.000Z
std::string ToIso8601(TimePoint tp);

} // namespace datarouter::util
