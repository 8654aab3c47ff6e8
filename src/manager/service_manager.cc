#define CONDUCTOR_LOG_COMPONENT "manager"

#include "conductor/manager/service_manager.h"

#include <cstdlib>
#include <ctime>
#include <exception>
#include <thread>

#include <fmt/format.h>

#include "conductor/config/config_store.h"
#include "conductor/logging/log_macros.h"

namespace conductor {
namespace manager {

namespace {

std::string isoTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                    now.time_since_epoch()) %
                1000000;

  std::tm tm_buf;
  localtime_r(&time_t, &tm_buf);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
  return fmt::format("{}.{:06d}", buf, static_cast<int>(micros.count()));
}

logging::LogContext serviceContext(const std::string& service_id) {
  logging::LogContext ctx;
  ctx.service_id = service_id;
  return ctx;
}

}  // namespace

std::string ManagerConfig::defaultConfigPath() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg) {
    return std::string(xdg) + "/conductor/mcp_services.json";
  }
  const char* home = std::getenv("HOME");
  if (home && *home) {
    return std::string(home) + "/.config/conductor/mcp_services.json";
  }
  return "mcp_services.json";
}

json::JsonValue ManagerStats::toJson() const {
  return json::JsonObjectBuilder()
      .add("services_registered", services_registered)
      .add("services_running", services_running)
      .add("tools_available", tools_available)
      .add("requests_processed", requests_processed)
      .add("errors", errors)
      .add("timestamp", timestamp)
      .build();
}

ServiceManager::ServiceManager(const ManagerConfig& config)
    : ServiceManager(config, nullptr) {}

ServiceManager::ServiceManager(const ManagerConfig& config,
                               transport::TransportFactorySharedPtr factory)
    : config_(config), factory_(std::move(factory)) {
  if (!factory_) {
    transport::TransportOptions options;
    options.kill_grace = config_.process_kill_grace;
    factory_ = std::make_shared<transport::DefaultTransportFactory>(options);
  }
  client_info_.name = config_.client_name;
  client_info_.version = config_.client_version;
  CONDUCTOR_LOG(Debug, "service manager created, config {}",
                config_.config_path);
}

ServiceManager::~ServiceManager() { shutdown(); }

bool ServiceManager::initialize() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  if (initialized_) {
    return true;
  }

  config::ServiceConfigFile file;
  try {
    config::ConfigStore store(config_.config_path);
    if (config_.create_default_config) {
      file = store.loadOrCreateDefault();
    } else if (store.exists()) {
      file = store.load();
    } else {
      CONDUCTOR_LOG(Info, "no service configuration at {}",
                    config_.config_path);
    }
  } catch (const config::ConfigParseError& e) {
    CONDUCTOR_LOG(Error, "failed to load service configuration: {}",
                  e.what());
    return false;
  } catch (const std::exception& e) {
    CONDUCTOR_LOG(Error, "failed to load service configuration {}: {}",
                  config_.config_path, e.what());
    return false;
  }

  for (const auto& descriptor : file.services) {
    registerLocked(descriptor, false);
  }
  for (const auto& descriptor : file.services) {
    if (descriptor.auto_start && findClient(descriptor.id)) {
      startLocked(descriptor.id);
    }
  }

  monitor_ = std::make_unique<HealthMonitor>(config_.health_check_interval,
                                             [this]() { runHealthCheck(); });
  monitor_->start();

  initialized_ = true;
  CONDUCTOR_LOG(Info, "service manager initialized with {} service(s)",
                file.services.size());
  return true;
}

bool ServiceManager::registerService(
    const config::ServiceDescriptor& descriptor) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  return registerLocked(descriptor, true);
}

bool ServiceManager::registerLocked(
    const config::ServiceDescriptor& descriptor, bool allow_auto_start) {
  auto problems = descriptor.validate();
  if (!problems.empty()) {
    std::string joined;
    for (const auto& problem : problems) {
      joined += joined.empty() ? problem : "; " + problem;
    }
    CONDUCTOR_LOG(Error, "rejecting service '{}': {}", descriptor.id, joined);
    return false;
  }

  if (findClient(descriptor.id)) {
    CONDUCTOR_LOG(Info, "replacing registration of service {}",
                  descriptor.id);
    stopLocked(descriptor.id);
  }

  auto client = std::make_shared<client::ServiceClient>(descriptor, *factory_,
                                                        client_info_);
  client->setStatusCallback(
      [this](const std::string& id, client::ServiceStatus from,
             client::ServiceStatus to) { onStatusChange(id, from, to); });

  ClientPtr replaced;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    services_[descriptor.id] = descriptor;
    auto it = clients_.find(descriptor.id);
    if (it != clients_.end()) {
      replaced = std::move(it->second);
    }
    clients_[descriptor.id] = client;
    ++services_registered_;
  }
  // Destroyed outside the state lock
  replaced.reset();

  CONDUCTOR_LOG_CTX(Info, serviceContext(descriptor.id),
                    "registered service '{}' ({})", descriptor.name,
                    config::connectionTypeToString(descriptor.connection_type));

  if (allow_auto_start && descriptor.auto_start) {
    startLocked(descriptor.id);
  }
  return true;
}

bool ServiceManager::unregisterService(const std::string& service_id) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  if (!findClient(service_id)) {
    CONDUCTOR_LOG(Warning, "unregister: service {} not found", service_id);
    return false;
  }
  stopLocked(service_id);

  ClientPtr removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(service_id);
    if (it != clients_.end()) {
      removed = std::move(it->second);
      clients_.erase(it);
    }
    services_.erase(service_id);
    catalog_.removeService(service_id);
  }
  removed.reset();

  CONDUCTOR_LOG_CTX(Info, serviceContext(service_id), "unregistered");
  return true;
}

bool ServiceManager::startService(const std::string& service_id) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  return startLocked(service_id);
}

bool ServiceManager::startLocked(const std::string& service_id) {
  ClientPtr client = findClient(service_id);
  if (!client) {
    CONDUCTOR_LOG(Warning, "start: service {} not found", service_id);
    return false;
  }

  if (!client->connect()) {
    CONDUCTOR_LOG_CTX(Error, serviceContext(service_id),
                      "failed to start: {}",
                      client->lastError().value_or("unknown error"));
    return false;
  }

  auto tools = client->tools();
  std::vector<std::string> taken_over;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    taken_over = catalog_.merge(tools);
    running_.insert(service_id);
  }
  for (const auto& name : taken_over) {
    CONDUCTOR_LOG_CTX(Warning, serviceContext(service_id),
                      "tool '{}' now routed to this service", name);
  }
  CONDUCTOR_LOG_CTX(Info, serviceContext(service_id),
                    "started with {} tool(s)", tools.size());
  return true;
}

bool ServiceManager::stopService(const std::string& service_id) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  return stopLocked(service_id);
}

bool ServiceManager::stopLocked(const std::string& service_id) {
  ClientPtr client = findClient(service_id);
  if (!client) {
    CONDUCTOR_LOG(Warning, "stop: service {} not found", service_id);
    return false;
  }

  size_t removed = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    removed = catalog_.removeService(service_id);
    running_.erase(service_id);
  }
  client->disconnect();

  CONDUCTOR_LOG_CTX(Debug, serviceContext(service_id),
                    "stopped, {} tool(s) withdrawn", removed);
  return true;
}

bool ServiceManager::restartService(const std::string& service_id) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  return restartLocked(service_id);
}

bool ServiceManager::restartLocked(const std::string& service_id) {
  if (!stopLocked(service_id)) {
    return false;
  }
  std::this_thread::sleep_for(config_.restart_delay);
  return startLocked(service_id);
}

Result<json::JsonValue> ServiceManager::callTool(
    const std::string& tool_name,
    const json::JsonValue& arguments,
    optional<std::chrono::milliseconds> timeout) {
  ClientPtr client;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto tool = catalog_.find(tool_name);
    if (tool) {
      auto it = clients_.find(tool->service_id);
      if (it != clients_.end()) {
        client = it->second;
      }
    }
    if (!client) {
      ++errors_;
    }
  }
  if (!client) {
    CONDUCTOR_LOG(Error, "failed to call tool {}: not found", tool_name);
    return makeError<json::JsonValue>(ErrorCode::ToolNotFound,
                                      "Tool " + tool_name + " not found");
  }

  auto result = client->callTool(tool_name, arguments, timeout);

  std::lock_guard<std::mutex> lock(mutex_);
  if (isError(result)) {
    ++errors_;
  } else {
    ++requests_processed_;
  }
  return result;
}

std::vector<protocol::ToolDescriptor> ServiceManager::listTools(
    const optional<std::string>& service_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (service_id) {
    return catalog_.listForService(*service_id);
  }
  return catalog_.list();
}

json::JsonValue ServiceManager::getServiceStatus(
    const optional<std::string>& service_id) {
  if (service_id) {
    ClientPtr client = findClient(*service_id);
    if (!client) {
      return json::JsonObjectBuilder()
          .add("error", "Service " + *service_id + " not found")
          .build();
    }
    return client->getServiceInfo();
  }

  std::vector<std::pair<std::string, ClientPtr>> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.assign(clients_.begin(), clients_.end());
  }
  json::JsonValue all = json::JsonValue::object();
  for (const auto& entry : snapshot) {
    all.set(entry.first, entry.second->getServiceInfo());
  }
  return all;
}

ManagerStats ServiceManager::getManagerStats() const {
  ManagerStats stats;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stats.services_registered = services_registered_;
    stats.services_running = static_cast<int64_t>(running_.size());
    stats.tools_available = static_cast<int64_t>(catalog_.size());
    stats.requests_processed = requests_processed_;
    stats.errors = errors_;
  }
  stats.timestamp = isoTimestamp();
  return stats;
}

std::vector<DiscoveredService> ServiceManager::discoverServices() const {
  auto found = manager::discoverServices();
  size_t available = 0;
  for (const auto& service : found) {
    if (service.available) {
      ++available;
    }
  }
  CONDUCTOR_LOG(Info, "discovered {} of {} known MCP server(s)", available,
                found.size());
  return found;
}

bool ServiceManager::saveConfig() {
  config::ServiceConfigFile file;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : services_) {
      file.services.push_back(entry.second);
    }
  }

  try {
    config::ConfigStore(config_.config_path).save(file);
  } catch (const config::ConfigParseError& e) {
    CONDUCTOR_LOG(Error, "failed to save service configuration: {}",
                  e.what());
    return false;
  }
  return true;
}

bool ServiceManager::startDefaultServers() {
  if (!initialized_ && !initialize()) {
    return false;
  }

  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  std::vector<std::string> auto_start;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : services_) {
      if (entry.second.auto_start) {
        auto_start.push_back(entry.first);
      }
    }
  }

  size_t started = 0;
  for (const auto& id : auto_start) {
    if (startLocked(id)) {
      ++started;
    }
  }
  CONDUCTOR_LOG(Info, "started {} default MCP server(s)", started);
  return true;
}

bool ServiceManager::stopAllServers() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  size_t stopped = 0;
  for (const auto& id : getServiceIds()) {
    if (stopLocked(id)) {
      ++stopped;
    }
  }
  CONDUCTOR_LOG(Info, "stopped {} MCP server(s)", stopped);
  return true;
}

std::vector<std::string> ServiceManager::getActiveServers() const {
  std::vector<std::pair<std::string, ClientPtr>> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.assign(clients_.begin(), clients_.end());
  }
  std::vector<std::string> active;
  for (const auto& entry : snapshot) {
    if (entry.second->status() == client::ServiceStatus::Running) {
      active.push_back(entry.first);
    }
  }
  return active;
}

std::vector<std::string> ServiceManager::getServiceIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(clients_.size());
  for (const auto& entry : clients_) {
    ids.push_back(entry.first);
  }
  return ids;
}

void ServiceManager::runHealthCheck() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

  std::vector<ClientPtr> running;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : clients_) {
      running.push_back(entry.second);
    }
  }
  for (const auto& service : running) {
    if (service->status() == client::ServiceStatus::Running) {
      probeLocked(service);
    }
  }
}

void ServiceManager::probeLocked(const ClientPtr& client) {
  const auto& descriptor = client->descriptor();
  auto ctx = serviceContext(descriptor.id);

  auto probe = client->listTools();
  if (!isError(probe)) {
    if (config_.reset_retries_on_success) {
      client->resetRetryCount();
    }
    return;
  }

  const Error& error = errorOf(probe);
  CONDUCTOR_LOG_CTX(Warning, ctx, "health check failed: {}",
                    error.toString());
  client->markError(error.toString());
  {
    std::lock_guard<std::mutex> lock(mutex_);
    catalog_.removeService(descriptor.id);
    running_.erase(descriptor.id);
  }

  if (!descriptor.restart_on_failure) {
    return;
  }
  if (client->retryCount() >= descriptor.max_retries) {
    CONDUCTOR_LOG_CTX(Error, ctx,
                      "giving up after {} restart(s), manual restart required",
                      client->retryCount());
    return;
  }

  client->incrementRetryCount();
  CONDUCTOR_LOG_CTX(Info, ctx, "restarting (attempt {} of {})",
                    client->retryCount(), descriptor.max_retries);
  restartLocked(descriptor.id);
}

void ServiceManager::shutdown() {
  // The monitor's check takes the lifecycle mutex; stop it first
  if (monitor_) {
    monitor_->stop();
  }

  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  monitor_.reset();

  std::vector<ClientPtr> clients;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : clients_) {
      clients.push_back(entry.second);
    }
    if (clients.empty() && !initialized_) {
      return;
    }
  }

  for (const auto& client : clients) {
    client->disconnect();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    catalog_.clear();
    running_.clear();
    clients_.clear();
    services_.clear();
  }
  initialized_ = false;
  CONDUCTOR_LOG(Info, "service manager shut down");
}

ServiceManager::ClientPtr ServiceManager::findClient(
    const std::string& service_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = clients_.find(service_id);
  if (it == clients_.end()) {
    return nullptr;
  }
  return it->second;
}

void ServiceManager::onStatusChange(const std::string& service_id,
                                    client::ServiceStatus from,
                                    client::ServiceStatus to) {
  CONDUCTOR_LOG_CTX(Debug, serviceContext(service_id), "{} -> {}",
                    client::serviceStatusToString(from),
                    client::serviceStatusToString(to));
}

}  // namespace manager
}  // namespace conductor
