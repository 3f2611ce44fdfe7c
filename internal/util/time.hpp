#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace liveviewer::util {

// Wall clock helpers; batch ids use local time.

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

uint64_t NowMillis();

// Local time as yyyyMMddHHmmss.
std::string FormatCompactTimestamp(TimePoint tp);

} // namespace liveviewer::util
