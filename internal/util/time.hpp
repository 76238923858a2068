#pragma once

#include <chrono>
#include <cstdint>

namespace assetdb::util {

/*
  Monotonic clock used for deadlines and elapsed-time log fields.
*/

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t MillisSince(TimePoint start);

} // namespace assetdb::util
