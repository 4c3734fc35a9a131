#pragma once

#include <chrono>
#include <string>

namespace prepush::util {

/*
  Time utilities: the single place that picks clock sources.

  Wall time is for timestamps that get persisted, steady time for anything
  that measures elapsed durations.
*/

using Clock       = std::chrono::system_clock;
using TimePoint   = Clock::time_point;
using SteadyClock = std::chrono::steady_clock;
using Duration    = std::chrono::duration<double>;

TimePoint Now();

// "2024-05-01T12:30:00Z"
std::string FormatUtc(TimePoint tp);

double ToSeconds(Duration d);

class Stopwatch {
 public:
  Stopwatch() : start_(SteadyClock::now()) {
  }

  Duration Elapsed() const {
    return SteadyClock::now() - start_;
  }

 private:
  SteadyClock::time_point start_;
};

} // namespace prepush::util
