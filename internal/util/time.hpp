#pragma once

#include <chrono>
#include <string>

namespace migrator::util {

/*
  Wall-clock helpers for log naming and timings.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// Local time as "YYYY-MM-DD_HH-MM-SS", safe for file names.
std::string FormatFileTimestamp(TimePoint tp);

double ElapsedMillis(std::chrono::steady_clock::time_point since);

} // namespace migrator::util
