#pragma once

#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

#include "conductor/logging/logger.h"

namespace conductor {
namespace logging {

// Glob pattern ("transport.*") bound to a level
struct LogPattern {
  std::string glob;
  std::regex pattern;
  LogLevel level;

  LogPattern(const std::string& g, LogLevel lvl)
      : glob(g), pattern(globToRegex(g)), level(lvl) {}

 private:
  static std::string globToRegex(const std::string& glob) {
    std::string regex;
    for (char c : glob) {
      switch (c) {
        case '*':
          regex += ".*";
          break;
        case '?':
          regex += ".";
          break;
        case '.':
          regex += "\\.";
          break;
        default:
          regex += c;
          break;
      }
    }
    return regex;
  }
};

class LoggerRegistry {
 public:
  // Process-wide registry; works without any setup (stderr, Info)
  static LoggerRegistry& instance();

  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);
  std::shared_ptr<Logger> getDefaultLogger();

  void setGlobalLevel(LogLevel level);
  LogLevel getGlobalLevel() const;

  // Applies to every logger whose name starts with the component prefix
  void setComponentLevel(Component component, LogLevel level);

  // Later patterns take precedence over earlier ones
  void setPattern(const std::string& glob, LogLevel level);
  void clearPatterns();

  bool shouldLog(const std::string& logger_name, LogLevel level);
  LogLevel getEffectiveLevel(const std::string& name);

  // Replaces the sink of every existing and future logger
  void setDefaultSink(std::shared_ptr<LogSink> sink);
  std::shared_ptr<LogSink> getDefaultSink() const;

  std::vector<std::string> getLoggerNames() const;

 private:
  LoggerRegistry();

  LogLevel effectiveLevelLocked(const std::string& name) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  std::unordered_map<int, LogLevel> component_levels_;
  std::vector<LogPattern> patterns_;
  LogLevel global_level_{LogLevel::Info};
  std::shared_ptr<Logger> default_logger_;
  std::shared_ptr<LogSink> default_sink_;
};

}  // namespace logging
}  // namespace conductor
