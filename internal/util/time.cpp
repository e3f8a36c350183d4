#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace datarouter::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::string ToIso8601(TimePoint tp) {
  const auto ms      = ToUnixMillis(tp);
  std::time_t secs   = static_cast<std::time_t>(ms / 1000);
  std::tm     utc_tm = {};
  gmtime_r(&secs, &utc_tm);

  std::ostringstream out;
  out << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << (ms % 1000) << 'Z';
  return out.str();
}

} // namespace datarouter::util
