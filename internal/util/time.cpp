#include "time.hpp"

#include <ctime>

namespace prepush::util {

TimePoint Now() {
  return Clock::now();
}

std::string FormatUtc(TimePoint tp) {
  const std::time_t seconds = Clock::to_time_t(tp);

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  char buffer[32];
  const auto written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return std::string(buffer, written);
}

double ToSeconds(Duration d) {
  return d.count();
}

} // namespace prepush::util
