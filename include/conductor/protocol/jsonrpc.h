#ifndef CONDUCTOR_PROTOCOL_JSONRPC_H
#define CONDUCTOR_PROTOCOL_JSONRPC_H

#include <string>
#include <vector>

#include "conductor/core/result.h"
#include "conductor/json/json_bridge.h"

namespace conductor {
namespace protocol {

constexpr const char* kJsonRpcVersion = "2.0";
constexpr const char* kProtocolVersion = "2024-11-05";

namespace methods {
constexpr const char* kInitialize = "initialize";
constexpr const char* kInitialized = "notifications/initialized";
constexpr const char* kToolsList = "tools/list";
constexpr const char* kToolsCall = "tools/call";
}  // namespace methods

struct ClientInfo {
  std::string name{"conductor"};
  std::string version{"1.0.0"};
};

// A callable advertised by a service
struct ToolDescriptor {
  std::string name;
  std::string description;
  json::JsonValue input_schema;
  std::string service_id;  // owning service, not an ownership link
  bool enabled{true};
  optional<json::JsonValue> metadata;

  json::JsonValue toJson() const;
};

// What a server reported in its initialize result
struct ServerInfo {
  std::string protocol_version;
  json::JsonValue capabilities;
  json::JsonValue server_info;
};

// Random RFC 4122 version 4 UUID, e.g. "1b4e28ba-2fa1-41d2-883f-0016d3cca427"
std::string generateRequestId();

json::JsonValue makeRequest(const std::string& id,
                            const std::string& method,
                            const optional<json::JsonValue>& params = nullopt);

json::JsonValue makeNotification(
    const std::string& method,
    const optional<json::JsonValue>& params = nullopt);

json::JsonValue makeInitializeRequest(const std::string& id,
                                      const ClientInfo& client);
json::JsonValue makeInitializedNotification();
json::JsonValue makeListToolsRequest(const std::string& id);
json::JsonValue makeCallToolRequest(const std::string& id,
                                    const std::string& tool_name,
                                    const json::JsonValue& arguments);

// True for a response (result or error) whose id equals the given id
bool isResponseTo(const json::JsonValue& message, const std::string& id);

// Messages with a method and no id
bool isNotification(const json::JsonValue& message);

/**
 * Returns the "result" member of a response. A JSON-RPC "error" member
 * becomes ProtocolError with the error object in Error::data; a message
 * with neither member is a ProtocolError as well.
 */
Result<json::JsonValue> extractResult(const json::JsonValue& response);

// Parses result.tools into descriptors owned by service_id
Result<std::vector<ToolDescriptor>> parseToolList(
    const json::JsonValue& result, const std::string& service_id);

Result<ServerInfo> parseInitializeResult(const json::JsonValue& result);

}  // namespace protocol
}  // namespace conductor

#endif  // CONDUCTOR_PROTOCOL_JSONRPC_H
