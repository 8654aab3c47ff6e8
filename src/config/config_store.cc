#define CONDUCTOR_LOG_COMPONENT "config.store"

#include "conductor/config/config_store.h"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <yaml-cpp/yaml.h>

#include "conductor/logging/log_macros.h"

namespace conductor {
namespace config {

namespace {

constexpr size_t kMaxConfigFileBytes = 4 * 1024 * 1024;

bool endsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) ==
             0;
}

json::JsonValue yamlScalarToJsonValue(const YAML::Node& node) {
  const std::string& text = node.Scalar();

  // Quoted scalars carry the non-specific "!" tag and stay strings
  if (node.Tag() == "!") {
    return json::JsonValue(text);
  }
  if (text == "true" || text == "True" || text == "TRUE") {
    return json::JsonValue(true);
  }
  if (text == "false" || text == "False" || text == "FALSE") {
    return json::JsonValue(false);
  }

  int64_t integer = 0;
  if (YAML::convert<int64_t>::decode(node, integer)) {
    return json::JsonValue(integer);
  }
  if (text.find_first_of(".eE") != std::string::npos) {
    double number = 0;
    if (YAML::convert<double>::decode(node, number)) {
      return json::JsonValue(number);
    }
  }
  return json::JsonValue(text);
}

json::JsonValue yamlToJsonValue(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Scalar:
      return yamlScalarToJsonValue(node);
    case YAML::NodeType::Sequence: {
      auto result = json::JsonValue::array();
      for (const auto& item : node) {
        result.push_back(yamlToJsonValue(item));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      auto result = json::JsonValue::object();
      for (const auto& pair : node) {
        result.set(pair.first.as<std::string>(),
                   yamlToJsonValue(pair.second));
      }
      return result;
    }
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      break;
  }
  return json::JsonValue::null();
}

void emitYaml(YAML::Emitter& out, const json::JsonValue& value) {
  switch (value.type()) {
    case json::JsonType::Null:
      out << YAML::Null;
      break;
    case json::JsonType::Boolean:
      out << value.getBool();
      break;
    case json::JsonType::Integer:
      out << value.getInt64();
      break;
    case json::JsonType::Float:
      out << value.getFloat();
      break;
    case json::JsonType::String:
      // Quoted so numeric-looking strings read back as strings
      out << YAML::DoubleQuoted << value.getString();
      break;
    case json::JsonType::Array:
      out << YAML::BeginSeq;
      for (size_t i = 0; i < value.size(); ++i) {
        emitYaml(out, value[i]);
      }
      out << YAML::EndSeq;
      break;
    case json::JsonType::Object:
      out << YAML::BeginMap;
      for (const auto& [key, item] : value.items()) {
        out << YAML::Key << key << YAML::Value;
        emitYaml(out, item);
      }
      out << YAML::EndMap;
      break;
  }
}

ServiceDescriptor defaultService(const std::string& id,
                                 const std::string& name,
                                 const std::string& description,
                                 const std::string& command) {
  ServiceDescriptor d;
  d.id = id;
  d.name = name;
  d.description = description;
  d.connection_type = ConnectionType::Subprocess;
  d.command = command;
  d.args = std::vector<std::string>{};
  d.auto_start = false;
  return d;
}

}  // namespace

json::JsonValue ServiceConfigFile::toJson() const {
  json::JsonValue list = json::JsonValue::array();
  for (const auto& service : services) {
    list.push_back(service.toJson());
  }
  json::JsonValue out = json::JsonValue::object();
  out.set("version", version);
  out.set("services", list);
  return out;
}

ServiceConfigFile ServiceConfigFile::fromJson(const json::JsonValue& value,
                                              const std::string& file) {
  ParseContext ctx(file);
  if (!value.isObject()) {
    throw ctx.createError("Top-level configuration must be an object");
  }

  ServiceConfigFile config;
  json::JsonValue version = value["version"];
  if (!version.isNull()) {
    ParseContext::FieldScope scope(ctx, "version");
    if (!version.isString()) {
      throw ctx.createError("Expected string");
    }
    config.version = version.getString();
  }

  json::JsonValue services = value["services"];
  if (services.isNull()) {
    return config;
  }

  ParseContext::FieldScope scope(ctx, "services");
  if (!services.isArray()) {
    throw ctx.createError("Expected array of services");
  }
  for (size_t i = 0; i < services.size(); ++i) {
    ParseContext::FieldScope item(ctx, "[" + std::to_string(i) + "]");
    config.services.push_back(ServiceDescriptor::fromJson(services[i], ctx));
  }
  return config;
}

ConfigStore::ConfigStore(const std::string& path) : path_(path) {}

bool ConfigStore::exists() const {
  std::error_code ec;
  return std::filesystem::is_regular_file(path_, ec);
}

bool ConfigStore::isYaml() const {
  return endsWith(path_, ".yaml") || endsWith(path_, ".yml");
}

json::JsonValue ConfigStore::parseDocument(const std::string& content,
                                           bool yaml,
                                           const std::string& file) {
  if (!yaml) {
    try {
      return json::JsonValue::parse(content);
    } catch (const json::JsonException& e) {
      throw ConfigParseError(e.what(), "", file);
    }
  }

  try {
    return yamlToJsonValue(YAML::Load(content));
  } catch (const YAML::Exception& e) {
    std::ostringstream error;
    error << "YAML parse error at line " << e.mark.line + 1 << ", column "
          << e.mark.column + 1 << ": " << e.msg;
    throw ConfigParseError(error.str(), "", file);
  }
}

ServiceConfigFile ConfigStore::load() const {
  std::error_code ec;
  auto size = std::filesystem::file_size(path_, ec);
  if (ec) {
    throw ConfigParseError("Cannot stat file: " + ec.message(), "", path_);
  }
  if (size > kMaxConfigFileBytes) {
    throw ConfigParseError(
        "File too large (" + std::to_string(size) + " bytes)", "", path_);
  }

  std::ifstream file(path_);
  if (!file.is_open()) {
    throw ConfigParseError("Cannot open file", "", path_);
  }
  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());

  CONDUCTOR_LOG(Debug, "loading service configuration {} ({} bytes)", path_,
                content.size());

  ServiceConfigFile config =
      ServiceConfigFile::fromJson(parseDocument(content, isYaml(), path_),
                                  path_);
  CONDUCTOR_LOG(Info, "loaded {} service(s) from {}", config.services.size(),
                path_);
  return config;
}

void ConfigStore::save(const ServiceConfigFile& config) const {
  namespace fs = std::filesystem;

  std::string content;
  if (isYaml()) {
    YAML::Emitter out;
    emitYaml(out, config.toJson());
    content = std::string(out.c_str()) + "\n";
  } else {
    content = config.toJson().toString(true) + "\n";
  }

  std::error_code ec;
  fs::path target(path_);
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      throw ConfigParseError("Cannot create directory: " + ec.message(), "",
                             path_);
    }
  }

  // Write-then-rename so readers never observe a half-written file
  std::string temp_path = path_ + ".tmp";
  {
    std::ofstream file(temp_path, std::ios::trunc);
    if (!file.is_open()) {
      throw ConfigParseError("Cannot open file for writing", "", temp_path);
    }
    file << content;
    file.close();
    if (file.fail()) {
      fs::remove(temp_path, ec);
      throw ConfigParseError("Write failed", "", temp_path);
    }
  }
  fs::rename(temp_path, target, ec);
  if (ec) {
    throw ConfigParseError("Cannot replace file: " + ec.message(), "", path_);
  }

  CONDUCTOR_LOG(Info, "saved {} service(s) to {}", config.services.size(),
                path_);
}

ServiceConfigFile ConfigStore::loadOrCreateDefault() const {
  if (!exists()) {
    save(defaultConfig());
    CONDUCTOR_LOG(Info, "created default service configuration at {}", path_);
  }
  return load();
}

ServiceConfigFile ConfigStore::defaultConfig() {
  ServiceConfigFile config;
  config.services.push_back(defaultService("filesystem", "File System",
                                           "File system operations",
                                           "mcp-server-filesystem"));
  config.services.push_back(defaultService("brave_search", "Brave Search",
                                           "Web search via Brave",
                                           "mcp-server-brave-search"));
  return config;
}

}  // namespace config
}  // namespace conductor
