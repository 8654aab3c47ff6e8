#ifndef CONDUCTOR_TRANSPORT_HTTP_TRANSPORT_H
#define CONDUCTOR_TRANSPORT_HTTP_TRANSPORT_H

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "conductor/transport/transport.h"

namespace conductor {
namespace transport {

// Joined "data:" payloads of each event in a text/event-stream body
std::vector<std::string> parseSseEvents(const std::string& body);

/**
 * @brief JSON-RPC over HTTP POST (streamable HTTP)
 *
 * Each request is one POST to the endpoint. The server may answer with a
 * plain JSON body or an event stream whose events carry JSON-RPC messages.
 * An Mcp-Session-Id header returned by the server is echoed on every later
 * request.
 */
class HttpTransport : public Transport {
 public:
  explicit HttpTransport(std::chrono::milliseconds connect_timeout);
  ~HttpTransport() override;

  VoidResult connect(const config::ServiceDescriptor& descriptor) override;
  Result<json::JsonValue> sendRequest(
      const json::JsonValue& request,
      std::chrono::milliseconds timeout) override;
  VoidResult sendNotification(const json::JsonValue& notification) override;
  void close() override;
  bool isConnected() const override;
  std::string protocol() const override { return "http"; }

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace transport
}  // namespace conductor

#endif  // CONDUCTOR_TRANSPORT_HTTP_TRANSPORT_H
