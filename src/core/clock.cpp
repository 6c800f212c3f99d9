/// @file
/// @brief Timestamp formatting via strftime on the local time zone.

#include "core/clock.h"

#include <ctime>

namespace trackkey {

namespace {

std::string formatLocal(std::chrono::system_clock::time_point when, const char* pattern) {
  std::time_t secs = std::chrono::system_clock::to_time_t(when);
  std::tm local_tm{};
  localtime_r(&secs, &local_tm);
  char buf[64];
  size_t len = std::strftime(buf, sizeof(buf), pattern, &local_tm);
  return std::string(buf, len);
}

}  // namespace

std::string isoTimestamp(std::chrono::system_clock::time_point when) {
  return formatLocal(when, "%Y-%m-%dT%H:%M:%S");
}

std::string fileStamp(std::chrono::system_clock::time_point when) {
  return formatLocal(when, "%Y%m%d_%H%M%S");
}

std::string logStamp(std::chrono::system_clock::time_point when) {
  return formatLocal(when, "%Y-%m-%d %H:%M:%S");
}

}  // namespace trackkey
