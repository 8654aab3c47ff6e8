#ifndef CONDUCTOR_CONFIG_CONFIG_STORE_H
#define CONDUCTOR_CONFIG_CONFIG_STORE_H

#include <string>
#include <vector>

#include "conductor/config/service_descriptor.h"
#include "conductor/json/json_bridge.h"

namespace conductor {
namespace config {

// Contents of the persisted services file
struct ServiceConfigFile {
  std::string version{"1.0.0"};
  std::vector<ServiceDescriptor> services;

  json::JsonValue toJson() const;
  static ServiceConfigFile fromJson(const json::JsonValue& value,
                                    const std::string& file = "");
};

/**
 * @brief Loads and saves the services file
 *
 * The format follows the extension: .yaml/.yml files go through yaml-cpp,
 * everything else is JSON. All failures surface as ConfigParseError.
 */
class ConfigStore {
 public:
  explicit ConfigStore(const std::string& path);

  const std::string& path() const { return path_; }
  bool exists() const;
  bool isYaml() const;

  ServiceConfigFile load() const;
  void save(const ServiceConfigFile& config) const;

  // Writes defaultConfig() first when the file is missing
  ServiceConfigFile loadOrCreateDefault() const;

  // filesystem and brave_search, both with auto_start disabled
  static ServiceConfigFile defaultConfig();

  // Parses a document in either supported syntax
  static json::JsonValue parseDocument(const std::string& content,
                                       bool yaml,
                                       const std::string& file = "");

 private:
  std::string path_;
};

}  // namespace config
}  // namespace conductor

#endif  // CONDUCTOR_CONFIG_CONFIG_STORE_H
