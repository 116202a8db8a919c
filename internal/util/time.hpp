#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace pokertable::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// UTC, e.g. 2024-05-01T12:00:20.000Z
std::string ToIso8601(TimePoint tp);

} // namespace pokertable::util
