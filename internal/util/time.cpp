#include "time.hpp"

#include <ctime>

namespace migrator::util {

TimePoint Now() {
  return Clock::now();
}

std::string FormatFileTimestamp(TimePoint tp) {
  const std::time_t seconds = Clock::to_time_t(tp);
  std::tm           local{};
  localtime_r(&seconds, &local);

  char buffer[32];
  const auto written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", &local);
  return std::string(buffer, written);
}

double ElapsedMillis(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

} // namespace migrator::util
