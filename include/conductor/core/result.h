#ifndef CONDUCTOR_CORE_RESULT_H
#define CONDUCTOR_CORE_RESULT_H

#include <string>
#include <utility>

#include "conductor/core/compat.h"
#include "conductor/json/json_bridge.h"

namespace conductor {

// Error taxonomy shared by transports, protocol clients and the manager
enum class ErrorCode : int {
  ConfigError = 1,
  ConnectError,
  ProtocolError,
  ToolNotFound,
  ToolCallTimeout,
  ToolCallError,
  ServiceNotRunning,
  ServiceNotFound,
  TransportError,
  TransportTimeout,
  UnsupportedTransport,
};

inline const char* errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::ConfigError: return "ConfigError";
    case ErrorCode::ConnectError: return "ConnectError";
    case ErrorCode::ProtocolError: return "ProtocolError";
    case ErrorCode::ToolNotFound: return "ToolNotFound";
    case ErrorCode::ToolCallTimeout: return "ToolCallTimeout";
    case ErrorCode::ToolCallError: return "ToolCallError";
    case ErrorCode::ServiceNotRunning: return "ServiceNotRunning";
    case ErrorCode::ServiceNotFound: return "ServiceNotFound";
    case ErrorCode::TransportError: return "TransportError";
    case ErrorCode::TransportTimeout: return "TransportTimeout";
    case ErrorCode::UnsupportedTransport: return "UnsupportedTransport";
    default: return "Unknown";
  }
}

struct Error {
  ErrorCode code{ErrorCode::ProtocolError};
  std::string message;
  // Protocol error payload, when the peer sent one
  optional<json::JsonValue> data;

  Error() = default;
  Error(ErrorCode c, const std::string& m) : code(c), message(m) {}
  Error(ErrorCode c, const std::string& m, const json::JsonValue& d)
      : code(c), message(m), data(d) {}

  std::string toString() const {
    return std::string(errorCodeToString(code)) + ": " + message;
  }
};

template <typename T>
using Result = variant<T, Error>;

using VoidResult = Result<std::nullptr_t>;

inline VoidResult makeVoidSuccess() { return VoidResult(nullptr); }

inline VoidResult makeVoidError(const Error& error) {
  return VoidResult(error);
}

template <typename T>
Result<T> makeSuccess(T&& value) {
  return Result<T>(std::forward<T>(value));
}

template <typename T>
Result<T> makeError(const Error& error) {
  return Result<T>(error);
}

template <typename T>
Result<T> makeError(ErrorCode code, const std::string& message) {
  return Result<T>(Error(code, message));
}

template <typename T>
bool isError(const Result<T>& result) {
  return holds_alternative<Error>(result);
}

template <typename T>
const Error& errorOf(const Result<T>& result) {
  return get<Error>(result);
}

template <typename T>
const T& valueOf(const Result<T>& result) {
  return get<T>(result);
}

}  // namespace conductor

#endif  // CONDUCTOR_CORE_RESULT_H
