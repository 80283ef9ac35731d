#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace timeutil {

// Returns std::tm for local time corresponding to the given time_t in a
// thread-safe way across platforms.
inline std::tm LocalTime(const std::time_t &tt) {
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &tt);
#else
  localtime_r(&tt, &tm);
#endif
  return tm;
}

inline std::string NowLocalFormatted(const char *fmt) {
  auto now = std::chrono::system_clock::now();
  std::time_t tt = std::chrono::system_clock::to_time_t(now);
  std::tm tm = LocalTime(tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, fmt);
  return oss.str();
}

// Produces a human-friendly time for logs: HH:MM:SS
inline std::string ClockTime() { return NowLocalFormatted("%H:%M:%S"); }

// Run durations for the final summary: "1m02.345s" or "2.345s".
template <typename Rep, typename Period>
std::string FormatDuration(std::chrono::duration<Rep, Period> d) {
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
  const long long minutes = ms / 60000;
  const long long rest_ms = ms % 60000;
  char buf[48];
  if (minutes > 0) {
    std::snprintf(buf, sizeof(buf), "%lldm%02lld.%03llds", minutes,
                  rest_ms / 1000, rest_ms % 1000);
  } else {
    std::snprintf(buf, sizeof(buf), "%lld.%03llds", rest_ms / 1000,
                  rest_ms % 1000);
  }
  return buf;
}

} // namespace timeutil
