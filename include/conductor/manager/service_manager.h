#ifndef CONDUCTOR_MANAGER_SERVICE_MANAGER_H
#define CONDUCTOR_MANAGER_SERVICE_MANAGER_H

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "conductor/client/service_client.h"
#include "conductor/config/service_descriptor.h"
#include "conductor/core/result.h"
#include "conductor/manager/health_monitor.h"
#include "conductor/manager/service_discovery.h"
#include "conductor/manager/tool_catalog.h"
#include "conductor/transport/transport.h"

namespace conductor {
namespace manager {

struct ManagerConfig {
  // Service file; ".yaml"/".yml" selects YAML
  std::string config_path{defaultConfigPath()};
  std::chrono::milliseconds health_check_interval{std::chrono::seconds(60)};
  // Pause between stop and start in restartService()
  std::chrono::milliseconds restart_delay{std::chrono::seconds(1)};
  // Reset a client's retry count when a health probe succeeds
  bool reset_retries_on_success{false};
  // Write the default service file when config_path does not exist
  bool create_default_config{true};
  std::string client_name{"conductor"};
  std::string client_version{"1.0.0"};
  std::chrono::milliseconds process_kill_grace{std::chrono::seconds(5)};

  // $XDG_CONFIG_HOME/conductor/mcp_services.json, falling back to
  // $HOME/.config, then the working directory
  static std::string defaultConfigPath();
};

struct ManagerStats {
  int64_t services_registered{0};
  int64_t services_running{0};
  int64_t tools_available{0};
  int64_t requests_processed{0};
  int64_t errors{0};
  std::string timestamp;  // local time, ISO-8601

  json::JsonValue toJson() const;
};

/**
 * @brief Registry and lifecycle owner for MCP service clients
 *
 * Routes tool calls by name through a global catalog (last started service
 * wins a contested name) and runs a periodic health check that restarts
 * failed services up to their max_retries.
 *
 * Lifecycle operations are serialized by one mutex; the registry maps are
 * guarded by another that is never held across network I/O, so tool calls
 * to different services run in parallel.
 */
class ServiceManager {
 public:
  explicit ServiceManager(const ManagerConfig& config = ManagerConfig());
  ServiceManager(const ManagerConfig& config,
                 transport::TransportFactorySharedPtr factory);
  ~ServiceManager();

  ServiceManager(const ServiceManager&) = delete;
  ServiceManager& operator=(const ServiceManager&) = delete;

  // Loads the service file, starts auto-start services and the health
  // monitor. False on configuration errors; never throws.
  bool initialize();
  bool isInitialized() const { return initialized_; }

  // Replaces a registration with the same id. Starts the service when
  // auto_start is set; the start outcome does not affect the result.
  bool registerService(const config::ServiceDescriptor& descriptor);
  bool unregisterService(const std::string& service_id);

  bool startService(const std::string& service_id);
  bool stopService(const std::string& service_id);
  bool restartService(const std::string& service_id);

  Result<json::JsonValue> callTool(
      const std::string& tool_name,
      const json::JsonValue& arguments,
      optional<std::chrono::milliseconds> timeout = nullopt);

  std::vector<protocol::ToolDescriptor> listTools(
      const optional<std::string>& service_id = nullopt) const;

  // One service's info, or an object keyed by service id
  json::JsonValue getServiceStatus(
      const optional<std::string>& service_id = nullopt);

  ManagerStats getManagerStats() const;

  std::vector<DiscoveredService> discoverServices() const;

  bool saveConfig();

  bool startDefaultServers();
  bool stopAllServers();
  std::vector<std::string> getActiveServers() const;
  std::vector<std::string> getServiceIds() const;

  // One health-check pass
  void runHealthCheck();

  // Idempotent
  void shutdown();

  const ManagerConfig& config() const { return config_; }

 private:
  using ClientPtr = std::shared_ptr<client::ServiceClient>;

  // *Locked variants expect lifecycle_mutex_ to be held
  bool registerLocked(const config::ServiceDescriptor& descriptor,
                      bool allow_auto_start);
  bool startLocked(const std::string& service_id);
  bool stopLocked(const std::string& service_id);
  bool restartLocked(const std::string& service_id);
  void probeLocked(const ClientPtr& client);

  ClientPtr findClient(const std::string& service_id) const;
  void onStatusChange(const std::string& service_id,
                      client::ServiceStatus from,
                      client::ServiceStatus to);

  const ManagerConfig config_;
  transport::TransportFactorySharedPtr factory_;
  protocol::ClientInfo client_info_;

  std::mutex lifecycle_mutex_;

  mutable std::mutex mutex_;
  std::map<std::string, config::ServiceDescriptor> services_;
  std::map<std::string, ClientPtr> clients_;
  ToolCatalog catalog_;
  std::set<std::string> running_;
  int64_t services_registered_{0};
  int64_t requests_processed_{0};
  int64_t errors_{0};

  std::unique_ptr<HealthMonitor> monitor_;
  std::atomic<bool> initialized_{false};
};

}  // namespace manager
}  // namespace conductor

#endif  // CONDUCTOR_MANAGER_SERVICE_MANAGER_H
