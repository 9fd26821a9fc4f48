#pragma once

#include <chrono>
#include <cstdint>

namespace relay::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

// Unix millis of (now - age), clamped at 0.
uint64_t CutoffMillis(TimePoint now, std::chrono::milliseconds age);

} // namespace relay::util
