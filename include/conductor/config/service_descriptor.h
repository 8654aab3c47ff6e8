#ifndef CONDUCTOR_CONFIG_SERVICE_DESCRIPTOR_H
#define CONDUCTOR_CONFIG_SERVICE_DESCRIPTOR_H

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "conductor/config/parse_error.h"
#include "conductor/core/compat.h"
#include "conductor/json/json_bridge.h"

namespace conductor {
namespace config {

enum class ConnectionType { Stdio, Subprocess, WebSocket, Http };

const char* connectionTypeToString(ConnectionType type);
optional<ConnectionType> connectionTypeFromString(const std::string& name);

/**
 * Configuration record for one tool provider. Treated as immutable once
 * registered: change a service by registering a replacement with the same
 * id.
 *
 * args, env, command and metadata distinguish "absent" (nullopt, written as
 * null) from "present but empty".
 */
struct ServiceDescriptor {
  std::string id;
  std::string name;
  std::string description;
  ConnectionType connection_type{ConnectionType::Subprocess};
  std::string endpoint;
  optional<std::string> command;
  optional<std::vector<std::string>> args;
  optional<std::map<std::string, std::string>> env;
  bool auto_start{true};
  bool restart_on_failure{true};
  int max_retries{3};
  int timeout{30};  // seconds
  optional<json::JsonValue> metadata;

  std::chrono::milliseconds defaultTimeout() const {
    return std::chrono::seconds(timeout);
  }

  bool usesProcess() const {
    return connection_type == ConnectionType::Stdio ||
           connection_type == ConnectionType::Subprocess;
  }

  // Problems that make the descriptor unusable; empty when valid
  std::vector<std::string> validate() const;

  json::JsonValue toJson() const;

  // Throws ConfigParseError naming the offending field
  static ServiceDescriptor fromJson(const json::JsonValue& value);
  static ServiceDescriptor fromJson(const json::JsonValue& value,
                                    ParseContext& ctx);

  bool operator==(const ServiceDescriptor& other) const;
  bool operator!=(const ServiceDescriptor& other) const {
    return !(*this == other);
  }
};

}  // namespace config
}  // namespace conductor

#endif  // CONDUCTOR_CONFIG_SERVICE_DESCRIPTOR_H
