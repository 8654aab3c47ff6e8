#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include <fmt/format.h>

#include "conductor/logging/log_level.h"
#include "conductor/logging/log_message.h"
#include "conductor/logging/log_sink.h"

namespace conductor {
namespace logging {

// Named, synchronous logger. Formatting happens only when the level is
// enabled; the sink is shared with the registry's other loggers.
class Logger {
 public:
  explicit Logger(const std::string& name)
      : name_(name), component_(componentFromLoggerName(name)) {}

  template <typename... Args>
  void debug(const char* fmt, const Args&... args) {
    write(LogLevel::Debug, nullptr, 0, nullptr, nullptr, fmt, args...);
  }

  template <typename... Args>
  void info(const char* fmt, const Args&... args) {
    write(LogLevel::Info, nullptr, 0, nullptr, nullptr, fmt, args...);
  }

  template <typename... Args>
  void warning(const char* fmt, const Args&... args) {
    write(LogLevel::Warning, nullptr, 0, nullptr, nullptr, fmt, args...);
  }

  template <typename... Args>
  void error(const char* fmt, const Args&... args) {
    write(LogLevel::Error, nullptr, 0, nullptr, nullptr, fmt, args...);
  }

  template <typename... Args>
  void critical(const char* fmt, const Args&... args) {
    write(LogLevel::Critical, nullptr, 0, nullptr, nullptr, fmt, args...);
  }

  // Direct log with source location
  template <typename... Args>
  void log(LogLevel level,
           const char* file,
           int line,
           const char* function,
           const char* fmt,
           const Args&... args) {
    write(level, file, line, function, nullptr, fmt, args...);
  }

  template <typename... Args>
  void logWithContext(LogLevel level,
                      const LogContext& ctx,
                      const char* file,
                      int line,
                      const char* function,
                      const char* fmt,
                      const Args&... args) {
    write(level, file, line, function, &ctx, fmt, args...);
  }

  void setLevel(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
  }

  LogLevel getLevel() const { return level_.load(std::memory_order_relaxed); }

  bool shouldLog(LogLevel level) const {
    return level != LogLevel::Off &&
           level >= level_.load(std::memory_order_relaxed);
  }

  void setSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
  }

  std::shared_ptr<LogSink> getSink() const {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    return sink_;
  }

  const std::string& getName() const { return name_; }

  void flush();

 private:
  template <typename... Args>
  void write(LogLevel level,
             const char* file,
             int line,
             const char* function,
             const LogContext* ctx,
             const char* fmt,
             const Args&... args) {
    if (!shouldLog(level)) {
      return;
    }
    LogMessage msg;
    msg.level = level;
    msg.message = formatMessage(fmt, fmt::make_format_args(args...));
    msg.file = file;
    msg.line = line;
    msg.function = function;
    if (ctx) {
      ctx->applyTo(msg);
    }
    dispatch(msg);
  }

  static std::string formatMessage(const char* fmt, fmt::format_args args);
  void dispatch(LogMessage& msg);

  std::atomic<LogLevel> level_{LogLevel::Info};
  std::string name_;
  Component component_;
  std::shared_ptr<LogSink> sink_;
  mutable std::mutex sink_mutex_;
};

}  // namespace logging
}  // namespace conductor
