#define CONDUCTOR_LOG_COMPONENT "transport.websocket"

#include "conductor/transport/websocket_transport.h"

#include <atomic>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "conductor/logging/log_macros.h"
#include "conductor/protocol/jsonrpc.h"

namespace conductor {
namespace transport {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

optional<WebSocketEndpoint> parseWebSocketEndpoint(const std::string& url) {
  WebSocketEndpoint endpoint;
  std::string rest;
  if (url.rfind("ws://", 0) == 0) {
    rest = url.substr(5);
  } else if (url.rfind("wss://", 0) == 0) {
    rest = url.substr(6);
    endpoint.secure = true;
    endpoint.port = "443";
  } else {
    return nullopt;
  }

  auto slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    endpoint.target = rest.substr(slash);
  }

  auto colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
    endpoint.host = authority.substr(0, colon);
    endpoint.port = authority.substr(colon + 1);
  } else {
    endpoint.host = authority;
  }
  if (endpoint.host.size() > 2 && endpoint.host.front() == '[' &&
      endpoint.host.back() == ']') {
    endpoint.host = endpoint.host.substr(1, endpoint.host.size() - 2);
  }
  if (endpoint.host.empty() || endpoint.port.empty()) {
    return nullopt;
  }
  return endpoint;
}

class WebSocketTransport::Impl {
 public:
  explicit Impl(std::chrono::milliseconds connect_timeout)
      : connect_timeout_(connect_timeout) {}

  ~Impl() { close(); }

  VoidResult connect(const config::ServiceDescriptor& descriptor) {
    close();
    service_id_ = descriptor.id;

    auto endpoint = parseWebSocketEndpoint(descriptor.endpoint);
    if (!endpoint) {
      return makeVoidError(Error(ErrorCode::ConnectError,
                                 "Invalid WebSocket endpoint '" +
                                     descriptor.endpoint + "'"));
    }
    if (endpoint->secure) {
      return makeVoidError(Error(ErrorCode::UnsupportedTransport,
                                 "wss:// endpoints are not supported"));
    }

    auto deadline = Clock::now() + connect_timeout_;
    ioc_.restart();
    ws_ = std::make_unique<websocket::stream<beast::tcp_stream>>(ioc_);
    buffer_.consume(buffer_.size());
    read_pending_ = false;

    beast::error_code ec;
    tcp::resolver resolver(ioc_);
    auto results = resolver.resolve(endpoint->host, endpoint->port, ec);
    if (ec) {
      return connectFailed("resolve", ec);
    }

    bool done = false;
    beast::get_lowest_layer(*ws_).expires_after(connect_timeout_);
    beast::get_lowest_layer(*ws_).async_connect(
        results, [&](beast::error_code e, const tcp::endpoint&) {
          ec = e;
          done = true;
        });
    if (!runUntil(done, deadline)) {
      return connectFailed("connect", net::error::timed_out);
    }
    if (ec) {
      return connectFailed("connect", ec);
    }

    beast::get_lowest_layer(*ws_).expires_never();
    ws_->set_option(
        websocket::stream_base::timeout::suggested(beast::role_type::client));

    done = false;
    std::string host = endpoint->host + ":" + endpoint->port;
    ws_->async_handshake(host, endpoint->target, [&](beast::error_code e) {
      ec = e;
      done = true;
    });
    if (!runUntil(done, deadline)) {
      return connectFailed("handshake", net::error::timed_out);
    }
    if (ec) {
      return connectFailed("handshake", ec);
    }
    ws_->text(true);

    connected_ = true;
    CONDUCTOR_LOG(Info, "[{}] connected to {}", service_id_,
                  descriptor.endpoint);
    return makeVoidSuccess();
  }

  Result<json::JsonValue> sendRequest(const json::JsonValue& request,
                                      std::chrono::milliseconds timeout) {
    if (!connected_) {
      return makeError<json::JsonValue>(ErrorCode::TransportError,
                                        "Transport is not connected");
    }
    const std::string id = request["id"].getString("");
    auto deadline = Clock::now() + timeout;

    auto written = write(request.toString(), deadline);
    if (isError(written)) {
      return errorOf(written);
    }

    for (;;) {
      if (!read_pending_) {
        startRead();
      }
      if (!runUntil(read_done_, deadline)) {
        return makeError<json::JsonValue>(ErrorCode::TransportTimeout,
                                          "Timed out waiting for response");
      }
      read_pending_ = false;
      if (read_ec_) {
        connected_ = false;
        return makeError<json::JsonValue>(
            ErrorCode::TransportError, "WebSocket read failed: " +
                                           read_ec_.message());
      }

      std::string text = beast::buffers_to_string(buffer_.data());
      buffer_.consume(buffer_.size());

      json::JsonValue message;
      try {
        message = json::JsonValue::parse(text);
      } catch (const json::JsonException&) {
        CONDUCTOR_LOG(Debug, "[{}] skipping non-JSON frame", service_id_);
        continue;
      }
      if (protocol::isResponseTo(message, id)) {
        return message;
      }
      CONDUCTOR_LOG(Debug, "[{}] discarding unmatched frame {}", service_id_,
                    text);
    }
  }

  VoidResult sendNotification(const json::JsonValue& notification) {
    if (!connected_) {
      return makeVoidError(
          Error(ErrorCode::TransportError, "Transport is not connected"));
    }
    return write(notification.toString(),
                 Clock::now() + std::chrono::seconds(5));
  }

  void close() {
    bool was_connected = connected_.exchange(false);
    if (ws_) {
      beast::error_code ec;
      bool done = false;
      if (was_connected && !read_pending_) {
        ws_->async_close(websocket::close_code::normal,
                         [&](beast::error_code) { done = true; });
        runUntil(done, Clock::now() + std::chrono::seconds(1));
      }
      beast::get_lowest_layer(*ws_).socket().close(ec);
      // Let cancelled handlers run before the stream goes away
      ioc_.restart();
      ioc_.poll();
      ws_.reset();
    }
    read_pending_ = false;
    if (was_connected) {
      CONDUCTOR_LOG(Debug, "[{}] websocket closed", service_id_);
    }
  }

  bool isConnected() const { return connected_; }

 private:
  using Clock = std::chrono::steady_clock;

  // Drives the io_context until the flag flips or the deadline passes
  bool runUntil(const bool& done, Clock::time_point deadline) {
    while (!done) {
      auto now = Clock::now();
      if (now >= deadline) {
        return false;
      }
      if (ioc_.stopped()) {
        ioc_.restart();
      }
      ioc_.run_one_for(deadline - now);
    }
    return true;
  }

  void startRead() {
    read_done_ = false;
    read_pending_ = true;
    ws_->async_read(buffer_, [this](beast::error_code ec, std::size_t) {
      read_ec_ = ec;
      read_done_ = true;
    });
  }

  VoidResult write(const std::string& text, Clock::time_point deadline) {
    bool done = false;
    beast::error_code ec;
    ws_->async_write(net::buffer(text),
                     [&](beast::error_code e, std::size_t) {
                       ec = e;
                       done = true;
                     });
    if (!runUntil(done, deadline)) {
      // A half-written frame leaves the stream unusable. The handler
      // refers to this frame's locals, so drain it before returning.
      connected_ = false;
      beast::error_code ignored;
      beast::get_lowest_layer(*ws_).socket().close(ignored);
      ioc_.restart();
      while (!done) {
        ioc_.run_one();
      }
      return makeVoidError(Error(ErrorCode::TransportTimeout,
                                 "Timed out writing WebSocket frame"));
    }
    if (ec) {
      connected_ = false;
      return makeVoidError(Error(ErrorCode::TransportError,
                                 "WebSocket write failed: " + ec.message()));
    }
    return makeVoidSuccess();
  }

  VoidResult connectFailed(const char* stage, beast::error_code ec) {
    if (ws_) {
      beast::error_code ignored;
      beast::get_lowest_layer(*ws_).socket().close(ignored);
      ioc_.restart();
      ioc_.poll();
      ws_.reset();
    }
    CONDUCTOR_LOG(Warning, "[{}] websocket {} failed: {}", service_id_, stage,
                  ec.message());
    return makeVoidError(Error(ErrorCode::ConnectError,
                               std::string("WebSocket ") + stage +
                                   " failed: " + ec.message()));
  }

  std::chrono::milliseconds connect_timeout_;
  std::string service_id_;
  net::io_context ioc_;
  std::unique_ptr<websocket::stream<beast::tcp_stream>> ws_;
  beast::flat_buffer buffer_;
  bool read_pending_{false};
  bool read_done_{false};
  beast::error_code read_ec_;
  std::atomic<bool> connected_{false};
};

WebSocketTransport::WebSocketTransport(
    std::chrono::milliseconds connect_timeout)
    : impl_(std::make_unique<Impl>(connect_timeout)) {}

WebSocketTransport::~WebSocketTransport() = default;

VoidResult WebSocketTransport::connect(
    const config::ServiceDescriptor& descriptor) {
  return impl_->connect(descriptor);
}

Result<json::JsonValue> WebSocketTransport::sendRequest(
    const json::JsonValue& request, std::chrono::milliseconds timeout) {
  return impl_->sendRequest(request, timeout);
}

VoidResult WebSocketTransport::sendNotification(
    const json::JsonValue& notification) {
  return impl_->sendNotification(notification);
}

void WebSocketTransport::close() { impl_->close(); }

bool WebSocketTransport::isConnected() const { return impl_->isConnected(); }

}  // namespace transport
}  // namespace conductor
