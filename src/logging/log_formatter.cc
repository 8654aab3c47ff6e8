#include "conductor/logging/log_formatter.h"

#include <ctime>
#include <iterator>
#include <sstream>

#include <fmt/format.h>

#include "conductor/json/json_bridge.h"

namespace conductor {
namespace logging {

namespace {

std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;

  std::tm tm_buf;
  localtime_r(&time_t, &tm_buf);

  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
  return fmt::format("{}.{:03d}", buf, static_cast<int>(ms.count()));
}

std::string threadIdString(const std::thread::id& id) {
  std::ostringstream oss;
  oss << id;
  return oss.str();
}

// Strip directories so records stay readable
const char* baseName(const char* path) {
  const char* base = path;
  for (const char* p = path; *p; ++p) {
    if (*p == '/') {
      base = p + 1;
    }
  }
  return base;
}

}  // namespace

std::string DefaultFormatter::format(const LogMessage& msg) const {
  fmt::memory_buffer out;
  auto it = std::back_inserter(out);

  fmt::format_to(it, "[{}] [{}] [T:{}] ", formatTimestamp(msg.timestamp),
                 logLevelToString(msg.level), threadIdString(msg.thread_id));

  if (!msg.logger_name.empty()) {
    fmt::format_to(it, "[{}] ", msg.logger_name);
  }
  if (msg.file && msg.line > 0) {
    fmt::format_to(it, "[{}:{}] ", baseName(msg.file), msg.line);
  }
  if (!msg.service_id.empty()) {
    fmt::format_to(it, "[svc:{}] ", msg.service_id);
  }
  if (!msg.request_id.empty()) {
    fmt::format_to(it, "[req:{}] ", msg.request_id);
  }

  fmt::format_to(it, "{}", msg.message);

  if (!msg.key_values.empty()) {
    fmt::format_to(it, " {{");
    bool first = true;
    for (const auto& kv : msg.key_values) {
      fmt::format_to(it, "{}{}={}", first ? "" : ", ", kv.first, kv.second);
      first = false;
    }
    fmt::format_to(it, "}}");
  }

  return fmt::to_string(out);
}

std::string JsonFormatter::format(const LogMessage& msg) const {
  json::JsonValue record = json::JsonValue::object();
  record.set("timestamp", formatTimestamp(msg.timestamp));
  record.set("level", logLevelToString(msg.level));
  record.set("logger", msg.logger_name);
  record.set("thread", threadIdString(msg.thread_id));
  record.set("pid", static_cast<int64_t>(msg.process_id));
  if (msg.component != Component::Root) {
    record.set("component", componentToString(msg.component));
  }
  if (msg.file) {
    record.set("file", baseName(msg.file));
    record.set("line", msg.line);
  }
  if (!msg.service_id.empty()) {
    record.set("service_id", msg.service_id);
  }
  if (!msg.tool_name.empty()) {
    record.set("tool", msg.tool_name);
  }
  if (!msg.request_id.empty()) {
    record.set("request_id", msg.request_id);
  }
  record.set("message", msg.message);

  if (!msg.key_values.empty()) {
    json::JsonValue metadata = json::JsonValue::object();
    for (const auto& kv : msg.key_values) {
      metadata.set(kv.first, kv.second);
    }
    record.set("metadata", metadata);
  }

  return record.toString();
}

}  // namespace logging
}  // namespace conductor
