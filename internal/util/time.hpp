#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace mediacache::util {

/*
  Time utilities. Single place to control the clock source.

  Persisted times are integer Unix milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

// RFC 3339 rendering, used for the document's last_updated stamp.
std::string ToRfc3339(TimePoint tp);

} // namespace mediacache::util
