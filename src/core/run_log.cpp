/// @file
/// @brief RunLog implementation.

#include "core/run_log.h"

#include <chrono>
#include <vector>

#include "core/clock.h"

namespace trackkey {

const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:   return "DEBUG";
    case LogLevel::Info:    return "INFO";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error:   return "ERROR";
  }
  return "UNKNOWN";
}

RunLog::RunLog(LogLevel console_level) : console_level_(console_level) {}

RunLog::~RunLog() {
  if (file_) {
    std::fclose(file_);
  }
}

bool RunLog::openFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
  file_ = std::fopen(path.c_str(), "a");
  return file_ != nullptr;
}

void RunLog::debug(const char* component, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  write(LogLevel::Debug, component, fmt, args);
  va_end(args);
}

void RunLog::info(const char* component, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  write(LogLevel::Info, component, fmt, args);
  va_end(args);
}

void RunLog::warning(const char* component, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  write(LogLevel::Warning, component, fmt, args);
  va_end(args);
}

void RunLog::error(const char* component, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  write(LogLevel::Error, component, fmt, args);
  va_end(args);
}

uint32_t RunLog::warningCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return warning_count_;
}

uint32_t RunLog::errorCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return error_count_;
}

void RunLog::write(LogLevel level, const char* component, const char* fmt, va_list args) {
  // Format outside the lock; vsnprintf twice for messages longer than the stack buffer.
  char stack_buf[512];
  va_list args_copy;
  va_copy(args_copy, args);
  int needed = std::vsnprintf(stack_buf, sizeof(stack_buf), fmt, args_copy);
  va_end(args_copy);
  if (needed < 0) return;

  std::string message;
  if (static_cast<size_t>(needed) < sizeof(stack_buf)) {
    message.assign(stack_buf, static_cast<size_t>(needed));
  } else {
    std::vector<char> heap_buf(static_cast<size_t>(needed) + 1);
    std::vsnprintf(heap_buf.data(), heap_buf.size(), fmt, args);
    message.assign(heap_buf.data(), static_cast<size_t>(needed));
  }

  std::string stamp = logStamp(std::chrono::system_clock::now());

  std::lock_guard<std::mutex> lock(mutex_);
  if (level == LogLevel::Warning) ++warning_count_;
  if (level == LogLevel::Error) ++error_count_;

  if (console_enabled_ && level >= console_level_) {
    std::fprintf(stderr, "%s - %s - [%s] %s\n", stamp.c_str(), logLevelToString(level),
                 component, message.c_str());
  }
  if (file_ && level >= LogLevel::Info) {
    std::fprintf(file_, "%s - %s - [%s] %s\n", stamp.c_str(), logLevelToString(level),
                 component, message.c_str());
    std::fflush(file_);
  }
}

}  // namespace trackkey
