/**
 * @file parse_error.h
 * @brief Configuration parse errors carrying field and file context
 */

#pragma once

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace conductor {
namespace config {

class ConfigParseError : public std::runtime_error {
 public:
  ConfigParseError(const std::string& message,
                   const std::string& field = "",
                   const std::string& file = "")
      : std::runtime_error(formatError(message, field, file)),
        message_(message),
        field_(field),
        file_(file) {}

  const std::string& field() const { return field_; }
  const std::string& file() const { return file_; }
  const std::string& message() const { return message_; }

 private:
  static std::string formatError(const std::string& msg,
                                 const std::string& field,
                                 const std::string& file) {
    std::ostringstream oss;
    oss << "Configuration parse error";
    if (!file.empty()) {
      oss << " in " << file;
    }
    if (!field.empty()) {
      oss << " at field '" << field << "'";
    }
    oss << ": " << msg;
    return oss.str();
  }

  std::string message_;
  std::string field_;
  std::string file_;
};

/**
 * @brief Tracks the field path being parsed, e.g. "services[2].timeout"
 */
class ParseContext {
 public:
  ParseContext() = default;
  explicit ParseContext(const std::string& file) : current_file_(file) {}

  void pushField(const std::string& field) { path_stack_.push_back(field); }

  void popField() {
    if (!path_stack_.empty()) {
      path_stack_.pop_back();
    }
  }

  std::string getCurrentPath() const {
    std::string path;
    for (const auto& part : path_stack_) {
      if (!path.empty() && part.front() != '[') {
        path += '.';
      }
      path += part;
    }
    return path;
  }

  const std::string& getFile() const { return current_file_; }

  ConfigParseError createError(const std::string& message) const {
    return ConfigParseError(message, getCurrentPath(), current_file_);
  }

  class FieldScope {
   public:
    FieldScope(ParseContext& ctx, const std::string& field) : ctx_(ctx) {
      ctx_.pushField(field);
    }
    ~FieldScope() { ctx_.popField(); }

    FieldScope(const FieldScope&) = delete;
    FieldScope& operator=(const FieldScope&) = delete;

   private:
    ParseContext& ctx_;
  };

 private:
  std::vector<std::string> path_stack_;
  std::string current_file_;
};

}  // namespace config
}  // namespace conductor
