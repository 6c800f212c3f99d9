// Wall-clock timestamp formatting for reports and log lines.

#ifndef TRACKKEY_CORE_CLOCK_H
#define TRACKKEY_CORE_CLOCK_H

#include <chrono>
#include <string>

namespace trackkey {

/// @brief Local-time ISO-8601 timestamp, e.g. "2024-05-01T13:45:09".
std::string isoTimestamp(std::chrono::system_clock::time_point when);

/// @brief Local-time stamp for artifact file names, e.g. "20240501_134509".
std::string fileStamp(std::chrono::system_clock::time_point when);

/// @brief Local-time stamp for log lines, e.g. "2024-05-01 13:45:09".
std::string logStamp(std::chrono::system_clock::time_point when);

/// @brief isoTimestamp() for the current time.
inline std::string isoTimestampNow() {
  return isoTimestamp(std::chrono::system_clock::now());
}

}  // namespace trackkey

#endif  // TRACKKEY_CORE_CLOCK_H
