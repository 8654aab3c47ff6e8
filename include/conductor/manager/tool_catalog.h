#ifndef CONDUCTOR_MANAGER_TOOL_CATALOG_H
#define CONDUCTOR_MANAGER_TOOL_CATALOG_H

#include <map>
#include <string>
#include <vector>

#include "conductor/core/compat.h"
#include "conductor/protocol/jsonrpc.h"

namespace conductor {
namespace manager {

/**
 * @brief Tool name to owning service index
 *
 * Names are global: when two services advertise the same name the most
 * recent merge wins. Not thread-safe; the manager guards it with its state
 * mutex.
 */
class ToolCatalog {
 public:
  // Adds or overwrites entries. Returns the names taken over from another
  // service.
  std::vector<std::string> merge(
      const std::vector<protocol::ToolDescriptor>& tools);

  // Removes only the entries the service currently owns
  size_t removeService(const std::string& service_id);

  optional<protocol::ToolDescriptor> find(const std::string& name) const;
  std::vector<protocol::ToolDescriptor> list() const;
  std::vector<protocol::ToolDescriptor> listForService(
      const std::string& service_id) const;

  size_t size() const { return tools_.size(); }
  void clear() { tools_.clear(); }

 private:
  std::map<std::string, protocol::ToolDescriptor> tools_;
};

}  // namespace manager
}  // namespace conductor

#endif  // CONDUCTOR_MANAGER_TOOL_CATALOG_H
