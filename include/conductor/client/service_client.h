#ifndef CONDUCTOR_CLIENT_SERVICE_CLIENT_H
#define CONDUCTOR_CLIENT_SERVICE_CLIENT_H

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "conductor/config/service_descriptor.h"
#include "conductor/core/result.h"
#include "conductor/json/json_bridge.h"
#include "conductor/protocol/jsonrpc.h"
#include "conductor/transport/transport.h"

namespace conductor {
namespace client {

enum class ServiceStatus { Stopped, Starting, Running, Stopping, Error };

const char* serviceStatusToString(ServiceStatus status);

/**
 * @brief Protocol client for one service
 *
 * Owns the service descriptor and its transport. Lifecycle calls (connect,
 * disconnect) absorb failures into the Error state and lastError();
 * invocation calls return typed errors.
 *
 * State machine:
 *   Stopped -> Starting -> Running -> Stopping -> Stopped
 *   Starting | Running -> Error
 *   Error -> Starting (connect) | Stopping (disconnect)
 *
 * Transport access is serialized: one outstanding request per client.
 */
class ServiceClient {
 public:
  // (service_id, from, to), invoked after every transition without locks held
  using StatusCallback = std::function<void(
      const std::string& service_id, ServiceStatus from, ServiceStatus to)>;

  ServiceClient(const config::ServiceDescriptor& descriptor,
                transport::TransportFactory& factory,
                const protocol::ClientInfo& client_info = {});
  ~ServiceClient();

  ServiceClient(const ServiceClient&) = delete;
  ServiceClient& operator=(const ServiceClient&) = delete;

  // Opens the transport, performs the initialize handshake and fetches the
  // tool list. Returns true when Running; never throws.
  bool connect();

  // No-op when Stopped
  void disconnect();

  Result<json::JsonValue> callTool(
      const std::string& name,
      const json::JsonValue& arguments,
      optional<std::chrono::milliseconds> timeout = nullopt);

  // Refreshes the tool cache
  Result<std::vector<protocol::ToolDescriptor>> listTools();

  // Status snapshot; re-runs initialize when Running
  json::JsonValue getServiceInfo();

  ServiceStatus status() const;
  optional<std::string> lastError() const;
  std::vector<protocol::ToolDescriptor> tools() const;
  bool hasTool(const std::string& name) const;

  int retryCount() const;
  void incrementRetryCount();
  void resetRetryCount();

  // Moves to Error (health-check failure)
  void markError(const std::string& reason);

  const config::ServiceDescriptor& descriptor() const { return descriptor_; }

  void setStatusCallback(StatusCallback callback);

 private:
  void transition(ServiceStatus to);
  void fail(const std::string& reason);
  Result<json::JsonValue> roundTrip(const json::JsonValue& request,
                                    std::chrono::milliseconds timeout);
  Result<protocol::ServerInfo> handshake();
  Result<std::vector<protocol::ToolDescriptor>> fetchTools();

  const config::ServiceDescriptor descriptor_;
  const protocol::ClientInfo client_info_;
  transport::TransportPtr transport_;

  // Serializes transport use
  std::mutex io_mutex_;

  mutable std::mutex mutex_;
  ServiceStatus status_{ServiceStatus::Stopped};
  optional<std::string> last_error_;
  std::map<std::string, protocol::ToolDescriptor> tool_cache_;
  int retry_count_{0};
  StatusCallback status_callback_;
};

}  // namespace client
}  // namespace conductor

#endif  // CONDUCTOR_CLIENT_SERVICE_CLIENT_H
