#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace conductor {
namespace json {

class JsonValueImpl;

enum class JsonType { Null, Boolean, Integer, Float, String, Array, Object };

class JsonException : public std::runtime_error {
 public:
  explicit JsonException(const std::string& msg) : std::runtime_error(msg) {}
};

// Value type over the underlying JSON library. Element access returns
// copies; mutation goes through set() and push_back().
class JsonValue {
 public:
  JsonValue();  // null
  JsonValue(std::nullptr_t);
  JsonValue(bool value);
  JsonValue(int value);
  JsonValue(int64_t value);
  JsonValue(double value);
  JsonValue(const std::string& value);
  JsonValue(const char* value);

  JsonValue(const JsonValue& other);
  JsonValue(JsonValue&& other) noexcept;
  JsonValue& operator=(const JsonValue& other);
  JsonValue& operator=(JsonValue&& other) noexcept;
  ~JsonValue();

  // Type checking
  JsonType type() const;
  bool isNull() const;
  bool isBoolean() const;
  bool isInteger() const;
  bool isFloat() const;
  bool isNumber() const;
  bool isString() const;
  bool isArray() const;
  bool isObject() const;

  // Null, empty string, empty array and empty object are empty
  bool empty() const;

  // Value getters (throw JsonException on type mismatch)
  bool getBool() const;
  int getInt() const;
  int64_t getInt64() const;
  double getFloat() const;
  std::string getString() const;

  // Getters with defaults for missing or mistyped values
  bool getBool(bool defaultValue) const;
  int getInt(int defaultValue) const;
  int64_t getInt64(int64_t defaultValue) const;
  double getFloat(double defaultValue) const;
  std::string getString(const std::string& defaultValue) const;

  // Array or object size
  size_t size() const;

  // Array operations
  JsonValue operator[](size_t index) const;
  void push_back(const JsonValue& value);

  // Object operations
  bool contains(const std::string& key) const;
  JsonValue operator[](const std::string& key) const;  // null if missing
  JsonValue at(const std::string& key) const;  // throws if missing
  void set(const std::string& key, const JsonValue& value);
  void erase(const std::string& key);
  std::vector<std::string> keys() const;
  std::vector<std::pair<std::string, JsonValue>> items() const;

  std::string toString(bool pretty = false) const;

  bool operator==(const JsonValue& other) const;
  bool operator!=(const JsonValue& other) const { return !(*this == other); }

  static JsonValue null();
  static JsonValue array();
  static JsonValue object();
  static JsonValue parse(const std::string& json_str);

 private:
  friend class JsonValueImpl;
  std::unique_ptr<JsonValueImpl> impl_;
};

class JsonObjectBuilder {
 public:
  JsonObjectBuilder() : value_(JsonValue::object()) {}

  JsonObjectBuilder& add(const std::string& key, const JsonValue& val) {
    value_.set(key, val);
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, const std::string& val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, const char* val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, bool val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, int val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, int64_t val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonObjectBuilder& addNull(const std::string& key) {
    value_.set(key, JsonValue::null());
    return *this;
  }

  JsonValue build() const { return value_; }

 private:
  JsonValue value_;
};

class JsonArrayBuilder {
 public:
  JsonArrayBuilder() : value_(JsonValue::array()) {}

  JsonArrayBuilder& add(const JsonValue& val) {
    value_.push_back(val);
    return *this;
  }

  JsonArrayBuilder& add(const std::string& val) {
    value_.push_back(JsonValue(val));
    return *this;
  }

  JsonArrayBuilder& add(const char* val) {
    value_.push_back(JsonValue(val));
    return *this;
  }

  JsonValue build() const { return value_; }

 private:
  JsonValue value_;
};

}  // namespace json
}  // namespace conductor
