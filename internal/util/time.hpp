#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace photosift::util {

/*
  Time utilities. Single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

// UTC, second precision: 2024-01-31T12:00:00Z
std::string FormatUtc(uint64_t unix_ms);

} // namespace photosift::util
