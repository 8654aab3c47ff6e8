#ifndef CONDUCTOR_TRANSPORT_TRANSPORT_H
#define CONDUCTOR_TRANSPORT_TRANSPORT_H

#include <chrono>
#include <memory>
#include <string>

#include "conductor/config/service_descriptor.h"
#include "conductor/core/result.h"
#include "conductor/json/json_bridge.h"

namespace conductor {
namespace transport {

/**
 * @brief Connection to one service
 *
 * Implementations carry one outstanding request at a time; callers
 * serialize access. Responses whose id does not match the request in
 * flight (late replies to timed-out requests) and server notifications are
 * discarded.
 */
class Transport {
 public:
  virtual ~Transport() = default;

  // ConnectError, or UnsupportedTransport for endpoints this build cannot
  // reach
  virtual VoidResult connect(const config::ServiceDescriptor& descriptor) = 0;

  // Sends a request and waits for the response carrying the same id.
  // TransportTimeout when the deadline passes, TransportError on I/O
  // failure, ProtocolError when the peer sends something unparsable.
  virtual Result<json::JsonValue> sendRequest(
      const json::JsonValue& request, std::chrono::milliseconds timeout) = 0;

  virtual VoidResult sendNotification(const json::JsonValue& notification) = 0;

  // Idempotent
  virtual void close() = 0;

  virtual bool isConnected() const = 0;

  // Short name for logs: "stdio", "subprocess", "websocket", "http"
  virtual std::string protocol() const = 0;
};

using TransportPtr = std::unique_ptr<Transport>;

class TransportFactory {
 public:
  virtual ~TransportFactory() = default;

  virtual TransportPtr createTransport(config::ConnectionType type) = 0;
};

using TransportFactorySharedPtr = std::shared_ptr<TransportFactory>;

struct TransportOptions {
  // SIGTERM to SIGKILL grace for child processes
  std::chrono::milliseconds kill_grace{5000};
  std::chrono::milliseconds connect_timeout{10000};
};

class DefaultTransportFactory : public TransportFactory {
 public:
  explicit DefaultTransportFactory(const TransportOptions& options = {})
      : options_(options) {}

  TransportPtr createTransport(config::ConnectionType type) override;

 private:
  TransportOptions options_;
};

}  // namespace transport
}  // namespace conductor

#endif  // CONDUCTOR_TRANSPORT_TRANSPORT_H
