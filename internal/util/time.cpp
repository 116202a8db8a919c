#include "time.hpp"

#include <ctime>

#include <spdlog/fmt/fmt.h>

namespace pokertable::util {

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
  const auto  ms   = ToUnixMillis(tp);
  std::time_t secs = static_cast<std::time_t>(ms / 1000);
  std::tm     utc{};
  gmtime_r(&secs, &utc);
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min,
                     utc.tm_sec, ms % 1000);
}

} // namespace pokertable::util
