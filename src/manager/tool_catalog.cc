#include "conductor/manager/tool_catalog.h"

namespace conductor {
namespace manager {

std::vector<std::string> ToolCatalog::merge(
    const std::vector<protocol::ToolDescriptor>& tools) {
  std::vector<std::string> taken_over;
  for (const auto& tool : tools) {
    auto it = tools_.find(tool.name);
    if (it != tools_.end() && it->second.service_id != tool.service_id) {
      taken_over.push_back(tool.name);
    }
    tools_[tool.name] = tool;
  }
  return taken_over;
}

size_t ToolCatalog::removeService(const std::string& service_id) {
  size_t removed = 0;
  for (auto it = tools_.begin(); it != tools_.end();) {
    if (it->second.service_id == service_id) {
      it = tools_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

optional<protocol::ToolDescriptor> ToolCatalog::find(
    const std::string& name) const {
  auto it = tools_.find(name);
  if (it == tools_.end()) {
    return nullopt;
  }
  return it->second;
}

std::vector<protocol::ToolDescriptor> ToolCatalog::list() const {
  std::vector<protocol::ToolDescriptor> out;
  out.reserve(tools_.size());
  for (const auto& entry : tools_) {
    out.push_back(entry.second);
  }
  return out;
}

std::vector<protocol::ToolDescriptor> ToolCatalog::listForService(
    const std::string& service_id) const {
  std::vector<protocol::ToolDescriptor> out;
  for (const auto& entry : tools_) {
    if (entry.second.service_id == service_id) {
      out.push_back(entry.second);
    }
  }
  return out;
}

}  // namespace manager
}  // namespace conductor
