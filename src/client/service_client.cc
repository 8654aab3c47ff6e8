#define CONDUCTOR_LOG_COMPONENT "client"

#include "conductor/client/service_client.h"

#include <exception>

#include "conductor/logging/log_macros.h"

namespace conductor {
namespace client {

namespace {

logging::LogContext contextFor(const std::string& service_id,
                               const std::string& tool_name = "",
                               const std::string& request_id = "") {
  logging::LogContext ctx;
  ctx.service_id = service_id;
  ctx.tool_name = tool_name;
  ctx.request_id = request_id;
  return ctx;
}

}  // namespace

const char* serviceStatusToString(ServiceStatus status) {
  switch (status) {
    case ServiceStatus::Stopped: return "stopped";
    case ServiceStatus::Starting: return "starting";
    case ServiceStatus::Running: return "running";
    case ServiceStatus::Stopping: return "stopping";
    case ServiceStatus::Error: return "error";
  }
  return "unknown";
}

ServiceClient::ServiceClient(const config::ServiceDescriptor& descriptor,
                             transport::TransportFactory& factory,
                             const protocol::ClientInfo& client_info)
    : descriptor_(descriptor),
      client_info_(client_info),
      transport_(factory.createTransport(descriptor.connection_type)) {}

ServiceClient::~ServiceClient() { disconnect(); }

bool ServiceClient::connect() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ == ServiceStatus::Running) {
      return true;
    }
  }
  transition(ServiceStatus::Starting);

  auto ctx = contextFor(descriptor_.id);
  if (!transport_) {
    fail(std::string("No transport available for connection type ") +
         config::connectionTypeToString(descriptor_.connection_type));
    return false;
  }

  std::vector<protocol::ToolDescriptor> tools;
  try {
    std::lock_guard<std::mutex> io(io_mutex_);

    auto connected = transport_->connect(descriptor_);
    if (isError(connected)) {
      fail(errorOf(connected).toString());
      return false;
    }

    auto server = handshake();
    if (isError(server)) {
      fail(errorOf(server).toString());
      return false;
    }
    const auto& info = valueOf(server);
    CONDUCTOR_LOG_CTX(Debug, ctx, "initialized over {} (protocol {})",
                      transport_->protocol(), info.protocol_version);

    auto fetched = fetchTools();
    if (isError(fetched)) {
      fail(errorOf(fetched).toString());
      return false;
    }
    tools = valueOf(fetched);
  } catch (const std::exception& e) {
    fail(e.what());
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    tool_cache_.clear();
    for (auto& tool : tools) {
      tool_cache_[tool.name] = tool;
    }
    last_error_ = nullopt;
  }
  transition(ServiceStatus::Running);
  CONDUCTOR_LOG_CTX(Info, ctx, "connected, {} tool(s) available",
                    tools.size());
  return true;
}

void ServiceClient::disconnect() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ == ServiceStatus::Stopped) {
      return;
    }
  }
  transition(ServiceStatus::Stopping);
  if (transport_) {
    std::lock_guard<std::mutex> io(io_mutex_);
    transport_->close();
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    tool_cache_.clear();
  }
  transition(ServiceStatus::Stopped);
  CONDUCTOR_LOG_CTX(Info, contextFor(descriptor_.id), "disconnected");
}

Result<json::JsonValue> ServiceClient::callTool(
    const std::string& name,
    const json::JsonValue& arguments,
    optional<std::chrono::milliseconds> timeout) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != ServiceStatus::Running) {
      return makeError<json::JsonValue>(
          ErrorCode::ServiceNotRunning,
          "Service " + descriptor_.id + " is " +
              serviceStatusToString(status_));
    }
    if (tool_cache_.find(name) == tool_cache_.end()) {
      return makeError<json::JsonValue>(
          ErrorCode::ToolNotFound,
          "Tool " + name + " not found in service " + descriptor_.id);
    }
  }

  const std::string id = protocol::generateRequestId();
  auto ctx = contextFor(descriptor_.id, name, id);
  auto effective_timeout = timeout.value_or(descriptor_.defaultTimeout());

  Result<json::JsonValue> response = makeError<json::JsonValue>(
      ErrorCode::TransportError, "Transport unavailable");
  {
    std::lock_guard<std::mutex> io(io_mutex_);
    response = roundTrip(protocol::makeCallToolRequest(id, name, arguments),
                         effective_timeout);
  }

  if (isError(response)) {
    const Error& error = errorOf(response);
    if (error.code == ErrorCode::TransportTimeout) {
      CONDUCTOR_LOG_CTX(Warning, ctx, "tool call timed out after {}ms",
                        static_cast<int64_t>(effective_timeout.count()));
      return makeError<json::JsonValue>(
          ErrorCode::ToolCallTimeout,
          "Tool " + name + " timed out after " +
              std::to_string(effective_timeout.count()) + "ms");
    }
    CONDUCTOR_LOG_CTX(Error, ctx, "tool call failed: {}", error.toString());
    return error;
  }

  auto result = protocol::extractResult(valueOf(response));
  if (isError(result)) {
    Error error = errorOf(result);
    if (error.data) {
      error.code = ErrorCode::ToolCallError;
    }
    CONDUCTOR_LOG_CTX(Warning, ctx, "tool returned error: {}", error.message);
    return error;
  }

  CONDUCTOR_LOG_CTX(Debug, ctx, "tool call completed");
  return result;
}

Result<std::vector<protocol::ToolDescriptor>> ServiceClient::listTools() {
  using ResultType = Result<std::vector<protocol::ToolDescriptor>>;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != ServiceStatus::Running) {
      return ResultType(Error(ErrorCode::ServiceNotRunning,
                              "Service " + descriptor_.id + " is " +
                                  serviceStatusToString(status_)));
    }
  }

  ResultType fetched = ResultType(
      Error(ErrorCode::TransportError, "Transport unavailable"));
  {
    std::lock_guard<std::mutex> io(io_mutex_);
    fetched = fetchTools();
  }
  if (isError(fetched)) {
    return fetched;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  tool_cache_.clear();
  for (const auto& tool : valueOf(fetched)) {
    tool_cache_[tool.name] = tool;
  }
  return fetched;
}

json::JsonValue ServiceClient::getServiceInfo() {
  ServiceStatus current = status();

  json::JsonValue info = json::JsonValue::object();
  info.set("service_id", descriptor_.id);
  info.set("name", descriptor_.name);
  info.set("status", serviceStatusToString(current));

  if (current != ServiceStatus::Running) {
    auto error = lastError();
    info.set("error", error ? json::JsonValue(*error) : json::JsonValue());
    return info;
  }

  Result<protocol::ServerInfo> server =
      makeError<protocol::ServerInfo>(ErrorCode::TransportError,
                                      "Transport unavailable");
  try {
    std::lock_guard<std::mutex> io(io_mutex_);
    server = handshake();
  } catch (const std::exception& e) {
    server = makeError<protocol::ServerInfo>(ErrorCode::ProtocolError,
                                             e.what());
  }

  if (isError(server)) {
    info.set("error", errorOf(server).toString());
    return info;
  }

  const auto& details = valueOf(server);
  info.set("protocol_version", details.protocol_version);
  info.set("capabilities", details.capabilities);
  info.set("server_info", details.server_info);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    info.set("tools_count", static_cast<int64_t>(tool_cache_.size()));
  }
  return info;
}

ServiceStatus ServiceClient::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

optional<std::string> ServiceClient::lastError() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_;
}

std::vector<protocol::ToolDescriptor> ServiceClient::tools() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<protocol::ToolDescriptor> out;
  out.reserve(tool_cache_.size());
  for (const auto& entry : tool_cache_) {
    out.push_back(entry.second);
  }
  return out;
}

bool ServiceClient::hasTool(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tool_cache_.find(name) != tool_cache_.end();
}

int ServiceClient::retryCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return retry_count_;
}

void ServiceClient::incrementRetryCount() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++retry_count_;
}

void ServiceClient::resetRetryCount() {
  std::lock_guard<std::mutex> lock(mutex_);
  retry_count_ = 0;
}

void ServiceClient::markError(const std::string& reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = reason;
  }
  transition(ServiceStatus::Error);
}

void ServiceClient::setStatusCallback(StatusCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  status_callback_ = std::move(callback);
}

void ServiceClient::transition(ServiceStatus to) {
  ServiceStatus from;
  StatusCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    from = status_;
    if (from == to) {
      return;
    }
    status_ = to;
    callback = status_callback_;
  }
  CONDUCTOR_LOG_CTX(Debug, contextFor(descriptor_.id), "status {} -> {}",
                    serviceStatusToString(from), serviceStatusToString(to));
  if (callback) {
    callback(descriptor_.id, from, to);
  }
}

void ServiceClient::fail(const std::string& reason) {
  if (transport_) {
    transport_->close();
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = reason;
    tool_cache_.clear();
  }
  transition(ServiceStatus::Error);
  CONDUCTOR_LOG_CTX(Error, contextFor(descriptor_.id), "connect failed: {}",
                    reason);
}

Result<json::JsonValue> ServiceClient::roundTrip(
    const json::JsonValue& request, std::chrono::milliseconds timeout) {
  if (!transport_ || !transport_->isConnected()) {
    return makeError<json::JsonValue>(ErrorCode::TransportError,
                                      "Transport is not connected");
  }
  return transport_->sendRequest(request, timeout);
}

Result<protocol::ServerInfo> ServiceClient::handshake() {
  auto response = roundTrip(
      protocol::makeInitializeRequest(protocol::generateRequestId(),
                                      client_info_),
      descriptor_.defaultTimeout());
  if (isError(response)) {
    return errorOf(response);
  }
  auto result = protocol::extractResult(valueOf(response));
  if (isError(result)) {
    return errorOf(result);
  }
  auto info = protocol::parseInitializeResult(valueOf(result));
  if (isError(info)) {
    return info;
  }

  auto notified =
      transport_->sendNotification(protocol::makeInitializedNotification());
  if (isError(notified)) {
    return errorOf(notified);
  }
  return info;
}

Result<std::vector<protocol::ToolDescriptor>> ServiceClient::fetchTools() {
  auto response =
      roundTrip(protocol::makeListToolsRequest(protocol::generateRequestId()),
                descriptor_.defaultTimeout());
  if (isError(response)) {
    return errorOf(response);
  }
  auto result = protocol::extractResult(valueOf(response));
  if (isError(result)) {
    return errorOf(result);
  }
  return protocol::parseToolList(valueOf(result), descriptor_.id);
}

}  // namespace client
}  // namespace conductor
