#include "conductor/logging/logger.h"

namespace conductor {
namespace logging {

std::string Logger::formatMessage(const char* fmt, fmt::format_args args) {
  try {
    return fmt::vformat(fmt, args);
  } catch (const fmt::format_error& e) {
    // A bad format string is a programming error; keep the record anyway
    return std::string(fmt) + " [format error: " + e.what() + "]";
  }
}

void Logger::dispatch(LogMessage& msg) {
  msg.logger_name = name_;
  msg.component = component_;

  std::shared_ptr<LogSink> sink = getSink();
  if (sink) {
    sink->log(msg);
  }
}

void Logger::flush() {
  std::shared_ptr<LogSink> sink = getSink();
  if (sink) {
    sink->flush();
  }
}

}  // namespace logging
}  // namespace conductor
