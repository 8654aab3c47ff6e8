#pragma once

#include <cstdint>
#include <string>

namespace conductor {
namespace logging {

// Log levels follow RFC-5424 severities
enum class LogLevel : uint8_t {
  Debug = 0,
  Info = 1,
  Notice = 2,
  Warning = 3,
  Error = 4,
  Critical = 5,
  Alert = 6,
  Emergency = 7,
  Off = 8
};

// Subsystems that tag their log records
enum class Component {
  Root,
  Manager,
  Client,
  Transport,
  Protocol,
  Config,
  Event,
  HealthCheck,
};

enum class SinkType { File, Stdio, Null, External };

inline const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Notice: return "NOTICE";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Critical: return "CRITICAL";
    case LogLevel::Alert: return "ALERT";
    case LogLevel::Emergency: return "EMERGENCY";
    case LogLevel::Off: return "OFF";
    default: return "UNKNOWN";
  }
}

inline LogLevel stringToLogLevel(const std::string& str) {
  if (str == "DEBUG" || str == "debug") return LogLevel::Debug;
  if (str == "INFO" || str == "info") return LogLevel::Info;
  if (str == "NOTICE" || str == "notice") return LogLevel::Notice;
  if (str == "WARNING" || str == "warning") return LogLevel::Warning;
  if (str == "ERROR" || str == "error") return LogLevel::Error;
  if (str == "CRITICAL" || str == "critical") return LogLevel::Critical;
  if (str == "ALERT" || str == "alert") return LogLevel::Alert;
  if (str == "EMERGENCY" || str == "emergency") return LogLevel::Emergency;
  if (str == "OFF" || str == "off") return LogLevel::Off;
  return LogLevel::Info;
}

inline const char* componentToString(Component component) {
  switch (component) {
    case Component::Root: return "root";
    case Component::Manager: return "manager";
    case Component::Client: return "client";
    case Component::Transport: return "transport";
    case Component::Protocol: return "protocol";
    case Component::Config: return "config";
    case Component::Event: return "event";
    case Component::HealthCheck: return "health";
    default: return "unknown";
  }
}

// Maps a dotted logger name ("transport.stdio") to its component
inline Component componentFromLoggerName(const std::string& name) {
  const std::string head = name.substr(0, name.find('.'));
  for (Component c : {Component::Manager, Component::Client,
                      Component::Transport, Component::Protocol,
                      Component::Config, Component::Event,
                      Component::HealthCheck}) {
    if (head == componentToString(c)) {
      return c;
    }
  }
  return Component::Root;
}

}  // namespace logging
}  // namespace conductor
