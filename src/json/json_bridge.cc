#include "conductor/json/json_bridge.h"

#include <new>

#include <nlohmann/json.hpp>

namespace conductor {
namespace json {

class JsonValueImpl {
 public:
  nlohmann::json json_;

  JsonValueImpl() : json_(nullptr) {}
  explicit JsonValueImpl(const nlohmann::json& j) : json_(j) {}
  explicit JsonValueImpl(nlohmann::json&& j) : json_(std::move(j)) {}

  static JsonValue wrap(nlohmann::json j) {
    JsonValue val;
    val.impl_->json_ = std::move(j);
    return val;
  }
};

JsonValue::JsonValue() : impl_(std::make_unique<JsonValueImpl>()) {}

JsonValue::JsonValue(std::nullptr_t)
    : impl_(std::make_unique<JsonValueImpl>()) {}

JsonValue::JsonValue(bool value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(value))) {}

JsonValue::JsonValue(int value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(value))) {}

JsonValue::JsonValue(int64_t value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(value))) {}

JsonValue::JsonValue(double value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(value))) {}

JsonValue::JsonValue(const std::string& value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(value))) {}

JsonValue::JsonValue(const char* value)
    : impl_(std::make_unique<JsonValueImpl>(
          nlohmann::json(std::string(value ? value : "")))) {}

JsonValue::JsonValue(const JsonValue& other)
    : impl_(std::make_unique<JsonValueImpl>(other.impl_->json_)) {}

// A moved-from value is left as null rather than without an impl
JsonValue::JsonValue(JsonValue&& other) noexcept
    : impl_(std::move(other.impl_)) {
  other.impl_.reset(new (std::nothrow) JsonValueImpl());
}

JsonValue& JsonValue::operator=(const JsonValue& other) {
  if (this != &other) {
    impl_->json_ = other.impl_->json_;
  }
  return *this;
}

JsonValue& JsonValue::operator=(JsonValue&& other) noexcept {
  if (this != &other) {
    std::swap(impl_, other.impl_);
    if (other.impl_) {
      other.impl_->json_ = nullptr;
    }
  }
  return *this;
}

JsonValue::~JsonValue() = default;

JsonType JsonValue::type() const {
  const auto& j = impl_->json_;
  if (j.is_boolean())
    return JsonType::Boolean;
  if (j.is_number_integer())
    return JsonType::Integer;
  if (j.is_number_float())
    return JsonType::Float;
  if (j.is_string())
    return JsonType::String;
  if (j.is_array())
    return JsonType::Array;
  if (j.is_object())
    return JsonType::Object;
  return JsonType::Null;
}

bool JsonValue::isNull() const { return impl_->json_.is_null(); }
bool JsonValue::isBoolean() const { return impl_->json_.is_boolean(); }
bool JsonValue::isInteger() const { return impl_->json_.is_number_integer(); }
bool JsonValue::isFloat() const { return impl_->json_.is_number_float(); }
bool JsonValue::isNumber() const { return impl_->json_.is_number(); }
bool JsonValue::isString() const { return impl_->json_.is_string(); }
bool JsonValue::isArray() const { return impl_->json_.is_array(); }
bool JsonValue::isObject() const { return impl_->json_.is_object(); }

bool JsonValue::empty() const {
  const auto& j = impl_->json_;
  if (j.is_null())
    return true;
  if (j.is_string())
    return j.get_ref<const std::string&>().empty();
  if (j.is_array() || j.is_object())
    return j.empty();
  return false;
}

bool JsonValue::getBool() const {
  if (!isBoolean()) {
    throw JsonException("Value is not a boolean");
  }
  return impl_->json_.get<bool>();
}

int JsonValue::getInt() const {
  if (!isNumber()) {
    throw JsonException("Value is not a number");
  }
  return impl_->json_.get<int>();
}

int64_t JsonValue::getInt64() const {
  if (!isNumber()) {
    throw JsonException("Value is not a number");
  }
  return impl_->json_.get<int64_t>();
}

double JsonValue::getFloat() const {
  if (!isNumber()) {
    throw JsonException("Value is not a number");
  }
  return impl_->json_.get<double>();
}

std::string JsonValue::getString() const {
  if (!isString()) {
    throw JsonException("Value is not a string");
  }
  return impl_->json_.get<std::string>();
}

bool JsonValue::getBool(bool defaultValue) const {
  return isBoolean() ? impl_->json_.get<bool>() : defaultValue;
}

int JsonValue::getInt(int defaultValue) const {
  return isNumber() ? impl_->json_.get<int>() : defaultValue;
}

int64_t JsonValue::getInt64(int64_t defaultValue) const {
  return isNumber() ? impl_->json_.get<int64_t>() : defaultValue;
}

double JsonValue::getFloat(double defaultValue) const {
  return isNumber() ? impl_->json_.get<double>() : defaultValue;
}

std::string JsonValue::getString(const std::string& defaultValue) const {
  return isString() ? impl_->json_.get<std::string>() : defaultValue;
}

size_t JsonValue::size() const {
  if (!isArray() && !isObject()) {
    throw JsonException("Value is not an array or object");
  }
  return impl_->json_.size();
}

JsonValue JsonValue::operator[](size_t index) const {
  if (!isArray()) {
    throw JsonException("Value is not an array");
  }
  if (index >= impl_->json_.size()) {
    throw JsonException("Array index out of range: " + std::to_string(index));
  }
  return JsonValueImpl::wrap(impl_->json_[index]);
}

void JsonValue::push_back(const JsonValue& value) {
  if (isNull()) {
    impl_->json_ = nlohmann::json::array();
  }
  if (!isArray()) {
    throw JsonException("Value is not an array");
  }
  impl_->json_.push_back(value.impl_->json_);
}

bool JsonValue::contains(const std::string& key) const {
  return isObject() && impl_->json_.contains(key);
}

JsonValue JsonValue::operator[](const std::string& key) const {
  if (!isObject()) {
    if (isNull()) {
      return JsonValue();
    }
    throw JsonException("Value is not an object");
  }
  auto it = impl_->json_.find(key);
  if (it == impl_->json_.end()) {
    return JsonValue();
  }
  return JsonValueImpl::wrap(*it);
}

JsonValue JsonValue::at(const std::string& key) const {
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  auto it = impl_->json_.find(key);
  if (it == impl_->json_.end()) {
    throw JsonException("Key not found: " + key);
  }
  return JsonValueImpl::wrap(*it);
}

void JsonValue::set(const std::string& key, const JsonValue& value) {
  if (isNull()) {
    impl_->json_ = nlohmann::json::object();
  }
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  impl_->json_[key] = value.impl_->json_;
}

void JsonValue::erase(const std::string& key) {
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  impl_->json_.erase(key);
}

std::vector<std::string> JsonValue::keys() const {
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  std::vector<std::string> result;
  result.reserve(impl_->json_.size());
  for (auto it = impl_->json_.begin(); it != impl_->json_.end(); ++it) {
    result.push_back(it.key());
  }
  return result;
}

std::vector<std::pair<std::string, JsonValue>> JsonValue::items() const {
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  std::vector<std::pair<std::string, JsonValue>> result;
  result.reserve(impl_->json_.size());
  for (auto it = impl_->json_.begin(); it != impl_->json_.end(); ++it) {
    result.emplace_back(it.key(), JsonValueImpl::wrap(it.value()));
  }
  return result;
}

std::string JsonValue::toString(bool pretty) const {
  // Replace invalid UTF-8 rather than throwing from a serializer
  if (pretty) {
    return impl_->json_.dump(2, ' ', false,
                             nlohmann::json::error_handler_t::replace);
  }
  return impl_->json_.dump(-1, ' ', false,
                           nlohmann::json::error_handler_t::replace);
}

bool JsonValue::operator==(const JsonValue& other) const {
  return impl_->json_ == other.impl_->json_;
}

JsonValue JsonValue::null() { return JsonValue(nullptr); }

JsonValue JsonValue::array() {
  return JsonValueImpl::wrap(nlohmann::json::array());
}

JsonValue JsonValue::object() {
  return JsonValueImpl::wrap(nlohmann::json::object());
}

JsonValue JsonValue::parse(const std::string& json_str) {
  try {
    return JsonValueImpl::wrap(nlohmann::json::parse(json_str));
  } catch (const nlohmann::json::parse_error& e) {
    throw JsonException("Parse error: " + std::string(e.what()));
  }
}

}  // namespace json
}  // namespace conductor
