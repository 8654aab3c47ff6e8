#include "conductor/protocol/jsonrpc.h"

#include <stdexcept>

#include <fmt/format.h>
#include <openssl/rand.h>

namespace conductor {
namespace protocol {

json::JsonValue ToolDescriptor::toJson() const {
  json::JsonValue out = json::JsonObjectBuilder()
                            .add("name", name)
                            .add("description", description)
                            .add("inputSchema", input_schema)
                            .add("service_id", service_id)
                            .add("enabled", enabled)
                            .build();
  out.set("metadata", metadata ? *metadata : json::JsonValue::null());
  return out;
}

std::string generateRequestId() {
  unsigned char bytes[16];
  if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
    throw std::runtime_error("RAND_bytes failed to produce a request id");
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);  // version 4
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);  // variant

  std::string out;
  out.reserve(36);
  for (int i = 0; i < 16; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out += '-';
    }
    out += fmt::format("{:02x}", bytes[i]);
  }
  return out;
}

json::JsonValue makeRequest(const std::string& id,
                            const std::string& method,
                            const optional<json::JsonValue>& params) {
  json::JsonValue request = json::JsonObjectBuilder()
                                .add("jsonrpc", kJsonRpcVersion)
                                .add("id", id)
                                .add("method", method)
                                .build();
  if (params) {
    request.set("params", *params);
  }
  return request;
}

json::JsonValue makeNotification(const std::string& method,
                                 const optional<json::JsonValue>& params) {
  json::JsonValue notification = json::JsonObjectBuilder()
                                     .add("jsonrpc", kJsonRpcVersion)
                                     .add("method", method)
                                     .build();
  if (params) {
    notification.set("params", *params);
  }
  return notification;
}

json::JsonValue makeInitializeRequest(const std::string& id,
                                      const ClientInfo& client) {
  json::JsonValue capabilities =
      json::JsonObjectBuilder().add("tools", json::JsonValue::object()).build();
  json::JsonValue client_info = json::JsonObjectBuilder()
                                    .add("name", client.name)
                                    .add("version", client.version)
                                    .build();
  json::JsonValue params = json::JsonObjectBuilder()
                               .add("protocolVersion", kProtocolVersion)
                               .add("capabilities", capabilities)
                               .add("clientInfo", client_info)
                               .build();
  return makeRequest(id, methods::kInitialize, params);
}

json::JsonValue makeInitializedNotification() {
  return makeNotification(methods::kInitialized);
}

json::JsonValue makeListToolsRequest(const std::string& id) {
  return makeRequest(id, methods::kToolsList);
}

json::JsonValue makeCallToolRequest(const std::string& id,
                                    const std::string& tool_name,
                                    const json::JsonValue& arguments) {
  json::JsonValue params =
      json::JsonObjectBuilder()
          .add("name", tool_name)
          .add("arguments",
               arguments.isNull() ? json::JsonValue::object() : arguments)
          .build();
  return makeRequest(id, methods::kToolsCall, params);
}

bool isResponseTo(const json::JsonValue& message, const std::string& id) {
  if (!message.isObject() || message.contains("method")) {
    return false;
  }
  if (!message.contains("result") && !message.contains("error")) {
    return false;
  }
  json::JsonValue message_id = message["id"];
  return message_id.isString() && message_id.getString() == id;
}

bool isNotification(const json::JsonValue& message) {
  return message.isObject() && message.contains("method") &&
         !message.contains("id");
}

Result<json::JsonValue> extractResult(const json::JsonValue& response) {
  if (!response.isObject()) {
    return makeError<json::JsonValue>(ErrorCode::ProtocolError,
                                      "Response is not a JSON object");
  }

  if (response.contains("error")) {
    json::JsonValue error = response["error"];
    std::string message = "unknown error";
    int code = 0;
    if (error.isObject()) {
      message = error["message"].getString(message);
      code = error["code"].getInt(0);
    } else if (error.isString()) {
      message = error.getString();
    }
    return Error(ErrorCode::ProtocolError,
                 fmt::format("JSON-RPC error {}: {}", code, message), error);
  }

  if (!response.contains("result")) {
    return makeError<json::JsonValue>(
        ErrorCode::ProtocolError, "Response has neither result nor error");
  }
  return response["result"];
}

Result<std::vector<ToolDescriptor>> parseToolList(
    const json::JsonValue& result, const std::string& service_id) {
  json::JsonValue tools = result["tools"];
  if (!tools.isArray()) {
    return makeError<std::vector<ToolDescriptor>>(
        ErrorCode::ProtocolError, "tools/list result has no tools array");
  }

  std::vector<ToolDescriptor> parsed;
  parsed.reserve(tools.size());
  for (size_t i = 0; i < tools.size(); ++i) {
    json::JsonValue entry = tools[i];
    if (!entry.isObject() || !entry["name"].isString() ||
        entry["name"].getString().empty()) {
      return makeError<std::vector<ToolDescriptor>>(
          ErrorCode::ProtocolError,
          fmt::format("tools[{}] has no usable name", i));
    }

    ToolDescriptor tool;
    tool.name = entry["name"].getString();
    tool.description = entry["description"].getString("");
    tool.input_schema = entry.contains("inputSchema")
                            ? entry["inputSchema"]
                            : json::JsonValue::object();
    tool.service_id = service_id;
    if (entry.contains("metadata") && !entry["metadata"].isNull()) {
      tool.metadata = entry["metadata"];
    }
    parsed.push_back(std::move(tool));
  }
  return parsed;
}

Result<ServerInfo> parseInitializeResult(const json::JsonValue& result) {
  if (!result.isObject()) {
    return makeError<ServerInfo>(ErrorCode::ProtocolError,
                                 "initialize result is not an object");
  }
  ServerInfo info;
  info.protocol_version = result["protocolVersion"].getString("");
  info.capabilities = result.contains("capabilities")
                          ? result["capabilities"]
                          : json::JsonValue::object();
  info.server_info = result.contains("serverInfo")
                         ? result["serverInfo"]
                         : json::JsonValue::object();
  return info;
}

}  // namespace protocol
}  // namespace conductor
