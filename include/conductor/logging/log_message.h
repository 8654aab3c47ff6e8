#pragma once

#include <chrono>
#include <map>
#include <string>
#include <thread>
#include <unistd.h>

#include "conductor/logging/log_level.h"

namespace conductor {
namespace logging {

struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string message;
  std::chrono::system_clock::time_point timestamp;

  Component component{Component::Root};
  std::string logger_name;

  // Source location
  const char* file{nullptr};
  int line{0};
  const char* function{nullptr};

  pid_t process_id{0};
  std::thread::id thread_id;

  // Orchestration fields, empty when not applicable
  std::string service_id;
  std::string tool_name;
  std::string request_id;

  std::map<std::string, std::string> key_values;

  LogMessage()
      : timestamp(std::chrono::system_clock::now()),
        process_id(getpid()),
        thread_id(std::this_thread::get_id()) {}
};

// Correlation data attached to a record by logWithContext()
struct LogContext {
  std::string service_id;
  std::string tool_name;
  std::string request_id;
  std::map<std::string, std::string> key_values;

  void applyTo(LogMessage& msg) const {
    msg.service_id = service_id;
    msg.tool_name = tool_name;
    msg.request_id = request_id;
    for (const auto& kv : key_values) {
      msg.key_values[kv.first] = kv.second;
    }
  }
};

}  // namespace logging
}  // namespace conductor
