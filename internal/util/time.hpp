#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace danmaku::util {

/*
  Time utilities. Wall clock for persisted timestamps, steady clock for pacing and auto-stop.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Monotonic source for elapsed-time limits. Replaceable in tests.
using SteadyClock = std::chrono::steady_clock;
using SteadyNowFn = std::function<SteadyClock::time_point()>;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
int64_t  ToUnixSeconds(TimePoint tp);
uint64_t ToUnixMicros(TimePoint tp);

SteadyNowFn DefaultSteadyNow();

// Seconds given as a double, e.g. 8.25 -> 8250ms.
std::chrono::milliseconds SecondsToMillis(double seconds);

} // namespace danmaku::util
