#include "conductor/config/service_descriptor.h"

namespace conductor {
namespace config {

namespace {

std::string typeName(const json::JsonValue& value) {
  switch (value.type()) {
    case json::JsonType::Null: return "null";
    case json::JsonType::Boolean: return "boolean";
    case json::JsonType::Integer: return "integer";
    case json::JsonType::Float: return "number";
    case json::JsonType::String: return "string";
    case json::JsonType::Array: return "array";
    case json::JsonType::Object: return "object";
  }
  return "unknown";
}

std::string requireString(const json::JsonValue& obj,
                          const std::string& field,
                          ParseContext& ctx) {
  ParseContext::FieldScope scope(ctx, field);
  if (!obj.contains(field)) {
    throw ctx.createError("Required field '" + field + "' is missing");
  }
  json::JsonValue value = obj[field];
  if (!value.isString()) {
    throw ctx.createError("Expected string, got " + typeName(value));
  }
  return value.getString();
}

std::string optionalString(const json::JsonValue& obj,
                           const std::string& field,
                           const std::string& fallback,
                           ParseContext& ctx) {
  json::JsonValue value = obj[field];
  if (value.isNull()) {
    return fallback;
  }
  ParseContext::FieldScope scope(ctx, field);
  if (!value.isString()) {
    throw ctx.createError("Expected string, got " + typeName(value));
  }
  return value.getString();
}

bool optionalBool(const json::JsonValue& obj,
                  const std::string& field,
                  bool fallback,
                  ParseContext& ctx) {
  json::JsonValue value = obj[field];
  if (value.isNull()) {
    return fallback;
  }
  ParseContext::FieldScope scope(ctx, field);
  if (!value.isBoolean()) {
    throw ctx.createError("Expected boolean, got " + typeName(value));
  }
  return value.getBool();
}

int optionalInt(const json::JsonValue& obj,
                const std::string& field,
                int fallback,
                ParseContext& ctx) {
  json::JsonValue value = obj[field];
  if (value.isNull()) {
    return fallback;
  }
  ParseContext::FieldScope scope(ctx, field);
  if (!value.isInteger()) {
    throw ctx.createError("Expected integer, got " + typeName(value));
  }
  int result = value.getInt();
  if (result < 0) {
    throw ctx.createError("Value must not be negative");
  }
  return result;
}

}  // namespace

const char* connectionTypeToString(ConnectionType type) {
  switch (type) {
    case ConnectionType::Stdio: return "stdio";
    case ConnectionType::Subprocess: return "subprocess";
    case ConnectionType::WebSocket: return "websocket";
    case ConnectionType::Http: return "http";
  }
  return "unknown";
}

optional<ConnectionType> connectionTypeFromString(const std::string& name) {
  if (name == "stdio") return ConnectionType::Stdio;
  if (name == "subprocess") return ConnectionType::Subprocess;
  if (name == "websocket") return ConnectionType::WebSocket;
  if (name == "http") return ConnectionType::Http;
  return nullopt;
}

std::vector<std::string> ServiceDescriptor::validate() const {
  std::vector<std::string> problems;
  if (id.empty()) {
    problems.push_back("id must not be empty");
  }
  if (usesProcess() && (!command || command->empty())) {
    problems.push_back(std::string("command is required for ") +
                       connectionTypeToString(connection_type) +
                       " services");
  }
  if (!usesProcess() && endpoint.empty()) {
    problems.push_back(std::string("endpoint is required for ") +
                       connectionTypeToString(connection_type) +
                       " services");
  }
  if (timeout <= 0) {
    problems.push_back("timeout must be positive");
  }
  if (max_retries < 0) {
    problems.push_back("max_retries must not be negative");
  }
  return problems;
}

json::JsonValue ServiceDescriptor::toJson() const {
  json::JsonValue out = json::JsonValue::object();
  out.set("id", id);
  out.set("name", name);
  out.set("description", description);
  out.set("connection_type", connectionTypeToString(connection_type));
  out.set("endpoint", endpoint);
  out.set("command", command ? json::JsonValue(*command) : json::JsonValue());

  if (args) {
    json::JsonValue list = json::JsonValue::array();
    for (const auto& arg : *args) {
      list.push_back(arg);
    }
    out.set("args", list);
  } else {
    out.set("args", json::JsonValue::null());
  }

  if (env) {
    json::JsonValue vars = json::JsonValue::object();
    for (const auto& kv : *env) {
      vars.set(kv.first, kv.second);
    }
    out.set("env", vars);
  } else {
    out.set("env", json::JsonValue::null());
  }

  out.set("auto_start", auto_start);
  out.set("restart_on_failure", restart_on_failure);
  out.set("max_retries", max_retries);
  out.set("timeout", timeout);
  out.set("metadata", metadata ? *metadata : json::JsonValue::null());
  return out;
}

ServiceDescriptor ServiceDescriptor::fromJson(const json::JsonValue& value) {
  ParseContext ctx;
  return fromJson(value, ctx);
}

ServiceDescriptor ServiceDescriptor::fromJson(const json::JsonValue& value,
                                              ParseContext& ctx) {
  if (!value.isObject()) {
    throw ctx.createError("Service entry must be an object, got " +
                          typeName(value));
  }

  ServiceDescriptor d;
  d.id = requireString(value, "id", ctx);
  if (d.id.empty()) {
    ParseContext::FieldScope scope(ctx, "id");
    throw ctx.createError("Service id must not be empty");
  }
  d.name = optionalString(value, "name", d.id, ctx);
  d.description = optionalString(value, "description", "", ctx);

  std::string type_name =
      optionalString(value, "connection_type", "subprocess", ctx);
  auto type = connectionTypeFromString(type_name);
  if (!type) {
    ParseContext::FieldScope scope(ctx, "connection_type");
    throw ctx.createError("Unknown connection type '" + type_name + "'");
  }
  d.connection_type = *type;

  d.endpoint = optionalString(value, "endpoint", "", ctx);

  json::JsonValue command = value["command"];
  if (!command.isNull()) {
    ParseContext::FieldScope scope(ctx, "command");
    if (!command.isString()) {
      throw ctx.createError("Expected string, got " + typeName(command));
    }
    d.command = command.getString();
  }

  json::JsonValue args = value["args"];
  if (!args.isNull()) {
    ParseContext::FieldScope scope(ctx, "args");
    if (!args.isArray()) {
      throw ctx.createError("Expected array, got " + typeName(args));
    }
    std::vector<std::string> list;
    for (size_t i = 0; i < args.size(); ++i) {
      json::JsonValue arg = args[i];
      if (!arg.isString()) {
        ParseContext::FieldScope item(ctx, "[" + std::to_string(i) + "]");
        throw ctx.createError("Expected string, got " + typeName(arg));
      }
      list.push_back(arg.getString());
    }
    d.args = std::move(list);
  }

  json::JsonValue env = value["env"];
  if (!env.isNull()) {
    ParseContext::FieldScope scope(ctx, "env");
    if (!env.isObject()) {
      throw ctx.createError("Expected object, got " + typeName(env));
    }
    std::map<std::string, std::string> vars;
    for (const auto& [key, item] : env.items()) {
      if (!item.isString()) {
        ParseContext::FieldScope entry(ctx, key);
        throw ctx.createError("Expected string, got " + typeName(item));
      }
      vars[key] = item.getString();
    }
    d.env = std::move(vars);
  }

  d.auto_start = optionalBool(value, "auto_start", true, ctx);
  d.restart_on_failure = optionalBool(value, "restart_on_failure", true, ctx);
  d.max_retries = optionalInt(value, "max_retries", 3, ctx);
  d.timeout = optionalInt(value, "timeout", 30, ctx);

  json::JsonValue metadata = value["metadata"];
  if (!metadata.isNull()) {
    d.metadata = metadata;
  }

  return d;
}

bool ServiceDescriptor::operator==(const ServiceDescriptor& other) const {
  return id == other.id && name == other.name &&
         description == other.description &&
         connection_type == other.connection_type &&
         endpoint == other.endpoint && command == other.command &&
         args == other.args && env == other.env &&
         auto_start == other.auto_start &&
         restart_on_failure == other.restart_on_failure &&
         max_retries == other.max_retries && timeout == other.timeout &&
         metadata == other.metadata;
}

}  // namespace config
}  // namespace conductor
