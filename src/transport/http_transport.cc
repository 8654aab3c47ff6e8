#define CONDUCTOR_LOG_COMPONENT "transport.http"

#include "conductor/transport/http_transport.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <map>
#include <mutex>

#include <curl/curl.h>

#include "conductor/logging/log_macros.h"
#include "conductor/protocol/jsonrpc.h"

namespace conductor {
namespace transport {

namespace {

constexpr const char* kSessionHeader = "mcp-session-id";

void ensureCurlInitialized() {
  static std::once_flag flag;
  std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

std::string trim(const std::string& str) {
  size_t first = str.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  size_t last = str.find_last_not_of(" \t\r\n");
  return str.substr(first, last - first + 1);
}

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

// Header names are stored lowercased
size_t headerCallback(char* buffer, size_t size, size_t nitems,
                      void* userdata) {
  auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
  std::string line(buffer, size * nitems);
  size_t colon = line.find(':');
  if (colon != std::string::npos) {
    std::string name = toLower(trim(line.substr(0, colon)));
    if (!name.empty()) {
      (*headers)[name] = trim(line.substr(colon + 1));
    }
  }
  return size * nitems;
}

struct HttpResponse {
  long status{0};
  std::string body;
  std::map<std::string, std::string> headers;
};

}  // namespace

std::vector<std::string> parseSseEvents(const std::string& body) {
  std::vector<std::string> events;
  std::string data;
  bool has_data = false;

  auto dispatch = [&]() {
    if (has_data) {
      events.push_back(data);
    }
    data.clear();
    has_data = false;
  };

  size_t pos = 0;
  while (pos <= body.size()) {
    size_t end = body.find('\n', pos);
    std::string line = body.substr(
        pos, end == std::string::npos ? std::string::npos : end - pos);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (line.empty()) {
      dispatch();
    } else if (line[0] != ':') {
      size_t colon = line.find(':');
      std::string field = line.substr(0, colon);
      std::string value;
      if (colon != std::string::npos) {
        value = line.substr(colon + 1);
        if (!value.empty() && value[0] == ' ') {
          value.erase(0, 1);
        }
      }
      if (field == "data") {
        if (has_data) {
          data += '\n';
        }
        data += value;
        has_data = true;
      }
    }

    if (end == std::string::npos) {
      break;
    }
    pos = end + 1;
  }
  dispatch();
  return events;
}

class HttpTransport::Impl {
 public:
  explicit Impl(std::chrono::milliseconds connect_timeout)
      : connect_timeout_(connect_timeout) {
    ensureCurlInitialized();
  }

  ~Impl() { close(); }

  VoidResult connect(const config::ServiceDescriptor& descriptor) {
    close();
    service_id_ = descriptor.id;
    const std::string& url = descriptor.endpoint;
    if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
      return makeVoidError(Error(ErrorCode::ConnectError,
                                 "Invalid HTTP endpoint '" + url + "'"));
    }

    curl_ = curl_easy_init();
    if (!curl_) {
      return makeVoidError(
          Error(ErrorCode::ConnectError, "Failed to initialize CURL"));
    }
    url_ = url;
    session_id_.clear();
    connected_ = true;
    CONDUCTOR_LOG(Debug, "[{}] http transport ready for {}", service_id_,
                  url_);
    return makeVoidSuccess();
  }

  Result<json::JsonValue> sendRequest(const json::JsonValue& request,
                                      std::chrono::milliseconds timeout) {
    if (!connected_) {
      return makeError<json::JsonValue>(ErrorCode::TransportError,
                                        "Transport is not connected");
    }
    const std::string id = request["id"].getString("");

    HttpResponse response;
    auto posted = post(request.toString(), timeout, response);
    if (isError(posted)) {
      return errorOf(posted);
    }

    std::vector<std::string> payloads;
    auto content_type = response.headers.find("content-type");
    if (content_type != response.headers.end() &&
        toLower(content_type->second).find("text/event-stream") !=
            std::string::npos) {
      payloads = parseSseEvents(response.body);
    } else {
      payloads.push_back(response.body);
    }

    for (const auto& payload : payloads) {
      json::JsonValue message;
      try {
        message = json::JsonValue::parse(payload);
      } catch (const json::JsonException&) {
        CONDUCTOR_LOG(Debug, "[{}] skipping non-JSON payload", service_id_);
        continue;
      }

      // Batched replies arrive as an array
      if (message.isArray()) {
        for (size_t i = 0; i < message.size(); ++i) {
          json::JsonValue item = message[i];
          if (protocol::isResponseTo(item, id)) {
            return item;
          }
        }
      } else if (protocol::isResponseTo(message, id)) {
        return message;
      }
    }

    return makeError<json::JsonValue>(
        ErrorCode::ProtocolError,
        "HTTP response did not contain a reply to request " + id);
  }

  VoidResult sendNotification(const json::JsonValue& notification) {
    if (!connected_) {
      return makeVoidError(
          Error(ErrorCode::TransportError, "Transport is not connected"));
    }
    HttpResponse response;
    return post(notification.toString(), std::chrono::seconds(5), response);
  }

  void close() {
    bool was_connected = connected_.exchange(false);
    if (curl_) {
      curl_easy_cleanup(curl_);
      curl_ = nullptr;
    }
    session_id_.clear();
    if (was_connected) {
      CONDUCTOR_LOG(Debug, "[{}] http transport closed", service_id_);
    }
  }

  bool isConnected() const { return connected_; }

 private:
  VoidResult post(const std::string& body,
                  std::chrono::milliseconds timeout,
                  HttpResponse& response) {
    curl_easy_reset(curl_);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers =
        curl_slist_append(headers, "Accept: application/json, text/event-stream");
    if (!session_id_.empty()) {
      std::string session = "Mcp-Session-Id: " + session_id_;
      headers = curl_slist_append(headers, session.c_str());
    }

    curl_easy_setopt(curl_, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(body.size()));
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(connect_timeout_.count()));
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(timeout.count()));
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response.headers);

    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(headers);

    if (res == CURLE_OPERATION_TIMEDOUT) {
      return makeVoidError(
          Error(ErrorCode::TransportTimeout, "HTTP request timed out"));
    }
    if (res != CURLE_OK) {
      return makeVoidError(Error(ErrorCode::TransportError,
                                 std::string("HTTP request failed: ") +
                                     curl_easy_strerror(res)));
    }

    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status);
    auto session = response.headers.find(kSessionHeader);
    if (session != response.headers.end() && !session->second.empty()) {
      session_id_ = session->second;
    }

    if (response.status < 200 || response.status >= 300) {
      return makeVoidError(Error(
          ErrorCode::TransportError,
          "HTTP status " + std::to_string(response.status) + " from " + url_));
    }
    return makeVoidSuccess();
  }

  std::chrono::milliseconds connect_timeout_;
  std::string service_id_;
  std::string url_;
  std::string session_id_;
  CURL* curl_{nullptr};
  std::atomic<bool> connected_{false};
};

HttpTransport::HttpTransport(std::chrono::milliseconds connect_timeout)
    : impl_(std::make_unique<Impl>(connect_timeout)) {}

HttpTransport::~HttpTransport() = default;

VoidResult HttpTransport::connect(
    const config::ServiceDescriptor& descriptor) {
  return impl_->connect(descriptor);
}

Result<json::JsonValue> HttpTransport::sendRequest(
    const json::JsonValue& request, std::chrono::milliseconds timeout) {
  return impl_->sendRequest(request, timeout);
}

VoidResult HttpTransport::sendNotification(
    const json::JsonValue& notification) {
  return impl_->sendNotification(notification);
}

void HttpTransport::close() { impl_->close(); }

bool HttpTransport::isConnected() const { return impl_->isConnected(); }

}  // namespace transport
}  // namespace conductor
