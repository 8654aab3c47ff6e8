#define CONDUCTOR_LOG_COMPONENT "manager.discovery"

#include "conductor/manager/service_discovery.h"

#include <unistd.h>

#include <cstdlib>

#include "conductor/logging/log_macros.h"

namespace conductor {
namespace manager {

namespace {

constexpr const char* kServerPrefix = "mcp-server-";

struct KnownServer {
  const char* command;
  const char* name;
  const char* description;
};

const KnownServer kKnownServers[] = {
    {"mcp-server-filesystem", "File System", "File system operations"},
    {"mcp-server-brave-search", "Brave Search", "Web search via Brave"},
    {"mcp-server-git", "Git", "Git repository operations"},
    {"mcp-server-sqlite", "SQLite", "SQLite database operations"},
};

}  // namespace

json::JsonValue DiscoveredService::toJson() const {
  return json::JsonObjectBuilder()
      .add("id", id)
      .add("name", name)
      .add("description", description)
      .add("command", command)
      .add("available", available)
      .build();
}

optional<std::string> findExecutable(const std::string& command,
                                     const std::string& search_path) {
  if (command.find('/') != std::string::npos) {
    if (access(command.c_str(), X_OK) == 0) {
      return command;
    }
    return nullopt;
  }

  size_t start = 0;
  while (start <= search_path.size()) {
    size_t end = search_path.find(':', start);
    std::string dir = search_path.substr(
        start, end == std::string::npos ? std::string::npos : end - start);
    if (dir.empty()) {
      dir = ".";
    }
    std::string candidate = dir + "/" + command;
    if (access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
  return nullopt;
}

std::vector<DiscoveredService> discoverServices(
    const optional<std::string>& search_path) {
  std::string path;
  if (search_path) {
    path = *search_path;
  } else if (const char* env = std::getenv("PATH")) {
    path = env;
  }

  std::vector<DiscoveredService> found;
  for (const auto& server : kKnownServers) {
    DiscoveredService service;
    service.command = server.command;
    service.id = service.command.substr(std::char_traits<char>::length(kServerPrefix));
    service.name = server.name;
    service.description = server.description;
    service.available = findExecutable(service.command, path).has_value();
    CONDUCTOR_LOG(Debug, "{}: {}", service.command,
                  service.available ? "available" : "not found");
    found.push_back(std::move(service));
  }
  return found;
}

}  // namespace manager
}  // namespace conductor
