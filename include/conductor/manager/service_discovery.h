#ifndef CONDUCTOR_MANAGER_SERVICE_DISCOVERY_H
#define CONDUCTOR_MANAGER_SERVICE_DISCOVERY_H

#include <string>
#include <vector>

#include "conductor/core/compat.h"
#include "conductor/json/json_bridge.h"

namespace conductor {
namespace manager {

// A well-known MCP server executable and whether it is installed
struct DiscoveredService {
  std::string id;  // command without the "mcp-server-" prefix
  std::string name;
  std::string description;
  std::string command;
  bool available{false};

  json::JsonValue toJson() const;
};

// Full path of an executable found on a colon-separated search path
optional<std::string> findExecutable(const std::string& command,
                                     const std::string& search_path);

// Probes the known servers; search_path defaults to $PATH
std::vector<DiscoveredService> discoverServices(
    const optional<std::string>& search_path = nullopt);

}  // namespace manager
}  // namespace conductor

#endif  // CONDUCTOR_MANAGER_SERVICE_DISCOVERY_H
