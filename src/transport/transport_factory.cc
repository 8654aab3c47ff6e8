#include "conductor/transport/http_transport.h"
#include "conductor/transport/stdio_transport.h"
#include "conductor/transport/transport.h"
#include "conductor/transport/websocket_transport.h"

namespace conductor {
namespace transport {

TransportPtr DefaultTransportFactory::createTransport(
    config::ConnectionType type) {
  switch (type) {
    case config::ConnectionType::Stdio:
    case config::ConnectionType::Subprocess:
      return std::make_unique<ProcessTransport>(type, options_.kill_grace);
    case config::ConnectionType::WebSocket:
      return std::make_unique<WebSocketTransport>(options_.connect_timeout);
    case config::ConnectionType::Http:
      return std::make_unique<HttpTransport>(options_.connect_timeout);
  }
  return nullptr;
}

}  // namespace transport
}  // namespace conductor
