#ifndef CONDUCTOR_TRANSPORT_WEBSOCKET_TRANSPORT_H
#define CONDUCTOR_TRANSPORT_WEBSOCKET_TRANSPORT_H

#include <chrono>
#include <memory>
#include <string>

#include "conductor/transport/transport.h"

namespace conductor {
namespace transport {

// ws://host[:port][/path] endpoint split into its parts
struct WebSocketEndpoint {
  std::string host;
  std::string port{"80"};
  std::string target{"/"};
  bool secure{false};
};

// nullopt when the string is not a ws:// or wss:// URL
optional<WebSocketEndpoint> parseWebSocketEndpoint(const std::string& url);

/**
 * @brief JSON-RPC text frames over a WebSocket connection
 *
 * Plain ws:// only; wss:// endpoints fail with UnsupportedTransport. A read
 * cut short by a timeout stays pending and its frame is consumed (and
 * discarded if stale) by the next request.
 */
class WebSocketTransport : public Transport {
 public:
  explicit WebSocketTransport(std::chrono::milliseconds connect_timeout);
  ~WebSocketTransport() override;

  VoidResult connect(const config::ServiceDescriptor& descriptor) override;
  Result<json::JsonValue> sendRequest(
      const json::JsonValue& request,
      std::chrono::milliseconds timeout) override;
  VoidResult sendNotification(const json::JsonValue& notification) override;
  void close() override;
  bool isConnected() const override;
  std::string protocol() const override { return "websocket"; }

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace transport
}  // namespace conductor

#endif  // CONDUCTOR_TRANSPORT_WEBSOCKET_TRANSPORT_H
