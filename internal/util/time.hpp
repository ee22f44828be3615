#pragma once

#include <chrono>
#include <cstdint>

namespace atelier::util {

/*
  Time utilities. Record timestamps are epoch milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);

uint64_t NowMs();

} // namespace atelier::util
