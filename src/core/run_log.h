// Run log: leveled, printf-style log lines to stderr and an optional file.
//
// A RunLog is owned by whoever drives a run (the CLI, a test) and is passed
// by reference to the components that report progress. There is no global
// logger. All methods are safe to call from worker threads.

#ifndef TRACKKEY_CORE_RUN_LOG_H
#define TRACKKEY_CORE_RUN_LOG_H

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>

namespace trackkey {

/// Severity of a log line.
enum class LogLevel : uint8_t {
  Debug,
  Info,
  Warning,
  Error
};

/// @brief Convert LogLevel to the upper-case tag used in log lines.
const char* logLevelToString(LogLevel level);

/// @brief Leveled logger writing "stamp - LEVEL - [component] message" lines.
class RunLog {
 public:
  /// @param console_level Minimum level echoed to stderr.
  explicit RunLog(LogLevel console_level = LogLevel::Info);
  ~RunLog();

  RunLog(const RunLog&) = delete;
  RunLog& operator=(const RunLog&) = delete;

  /// @brief Open (append) a log file that receives every line at Info or above.
  /// @param path File path.
  /// @return False if the file could not be opened.
  bool openFile(const std::string& path);

  /// @brief Stop echoing to stderr (file output is unaffected).
  void setConsoleEnabled(bool enabled) { console_enabled_ = enabled; }

  void setConsoleLevel(LogLevel level) { console_level_ = level; }

  void debug(const char* component, const char* fmt, ...);
  void info(const char* component, const char* fmt, ...);
  void warning(const char* component, const char* fmt, ...);
  void error(const char* component, const char* fmt, ...);

  /// @brief Number of Warning lines emitted so far.
  uint32_t warningCount() const;

  /// @brief Number of Error lines emitted so far.
  uint32_t errorCount() const;

 private:
  void write(LogLevel level, const char* component, const char* fmt, va_list args);

  LogLevel console_level_;
  bool console_enabled_ = true;
  std::FILE* file_ = nullptr;
  uint32_t warning_count_ = 0;
  uint32_t error_count_ = 0;
  mutable std::mutex mutex_;
};

}  // namespace trackkey

#endif  // TRACKKEY_CORE_RUN_LOG_H
