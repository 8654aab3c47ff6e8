#include "conductor/logging/logger_registry.h"

namespace conductor {
namespace logging {

LoggerRegistry& LoggerRegistry::instance() {
  static LoggerRegistry instance;
  return instance;
}

LoggerRegistry::LoggerRegistry()
    : default_sink_(std::make_shared<StdioSink>(StdioSink::Stderr)) {
  default_logger_ = std::make_shared<Logger>("default");
  default_logger_->setSink(default_sink_);
  default_logger_->setLevel(global_level_);
  loggers_["default"] = default_logger_;
}

std::shared_ptr<Logger> LoggerRegistry::getDefaultLogger() {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_logger_;
}

std::shared_ptr<Logger> LoggerRegistry::getOrCreateLogger(
    const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second;
  }

  auto logger = std::make_shared<Logger>(name);
  logger->setLevel(effectiveLevelLocked(name));
  logger->setSink(default_sink_);
  loggers_[name] = logger;
  return logger;
}

void LoggerRegistry::setGlobalLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  global_level_ = level;
  for (auto& [name, logger] : loggers_) {
    logger->setLevel(effectiveLevelLocked(name));
  }
}

LogLevel LoggerRegistry::getGlobalLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return global_level_;
}

void LoggerRegistry::setComponentLevel(Component component, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  component_levels_[static_cast<int>(component)] = level;
  for (auto& [name, logger] : loggers_) {
    logger->setLevel(effectiveLevelLocked(name));
  }
}

void LoggerRegistry::setPattern(const std::string& glob, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  patterns_.emplace_back(glob, level);
  for (auto& [name, logger] : loggers_) {
    if (std::regex_match(name, patterns_.back().pattern)) {
      logger->setLevel(level);
    }
  }
}

void LoggerRegistry::clearPatterns() {
  std::lock_guard<std::mutex> lock(mutex_);
  patterns_.clear();
  for (auto& [name, logger] : loggers_) {
    logger->setLevel(effectiveLevelLocked(name));
  }
}

bool LoggerRegistry::shouldLog(const std::string& name, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second->shouldLog(level);
  }
  LogLevel effective = effectiveLevelLocked(name);
  return level != LogLevel::Off && level >= effective;
}

LogLevel LoggerRegistry::getEffectiveLevel(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return effectiveLevelLocked(name);
}

LogLevel LoggerRegistry::effectiveLevelLocked(const std::string& name) const {
  for (auto it = patterns_.rbegin(); it != patterns_.rend(); ++it) {
    if (std::regex_match(name, it->pattern)) {
      return it->level;
    }
  }

  Component component = componentFromLoggerName(name);
  if (component != Component::Root) {
    auto it = component_levels_.find(static_cast<int>(component));
    if (it != component_levels_.end()) {
      return it->second;
    }
  }

  return global_level_;
}

void LoggerRegistry::setDefaultSink(std::shared_ptr<LogSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  default_sink_ = std::move(sink);
  for (auto& entry : loggers_) {
    entry.second->setSink(default_sink_);
  }
}

std::shared_ptr<LogSink> LoggerRegistry::getDefaultSink() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_sink_;
}

std::vector<std::string> LoggerRegistry::getLoggerNames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(loggers_.size());
  for (const auto& entry : loggers_) {
    names.push_back(entry.first);
  }
  return names;
}

}  // namespace logging
}  // namespace conductor
