#pragma once

#include "cairn/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace cairn::common {

/// Minimal JSON document model. Objects keep their keys sorted, which is what makes
/// to_canonical_json deterministic.
class JsonValue {
public:
  enum class Type { Null, Bool, Integer, Number, String, Array, Object };

  using Array = std::vector<JsonValue>;
  using Object = std::map<std::string, JsonValue>;

  JsonValue() = default;

  static JsonValue null() { return JsonValue(); }
  static JsonValue boolean(bool value);
  static JsonValue integer(std::int64_t value);
  static JsonValue number(double value);
  static JsonValue string(std::string value);
  static JsonValue array(Array items = {});
  static JsonValue object(Object members = {});

  [[nodiscard]] Type type() const { return type_; }
  [[nodiscard]] bool is_null() const { return type_ == Type::Null; }
  [[nodiscard]] bool is_bool() const { return type_ == Type::Bool; }
  [[nodiscard]] bool is_integer() const { return type_ == Type::Integer; }
  [[nodiscard]] bool is_number() const {
    return type_ == Type::Number || type_ == Type::Integer;
  }
  [[nodiscard]] bool is_string() const { return type_ == Type::String; }
  [[nodiscard]] bool is_array() const { return type_ == Type::Array; }
  [[nodiscard]] bool is_object() const { return type_ == Type::Object; }

  // Accessors require the matching type and throw std::logic_error otherwise.
  [[nodiscard]] bool as_bool() const;
  [[nodiscard]] std::int64_t as_integer() const;
  [[nodiscard]] double as_double() const;
  [[nodiscard]] const std::string &as_string() const;
  [[nodiscard]] const Array &as_array() const;
  [[nodiscard]] const Object &as_object() const;

  /// Object member lookup; nullptr when absent or when this is not an object.
  [[nodiscard]] const JsonValue *find(const std::string &key) const;
  void set(const std::string &key, JsonValue value);
  bool erase(const std::string &key);
  void push_back(JsonValue value);

  bool operator==(const JsonValue &other) const;
  bool operator!=(const JsonValue &other) const { return !(*this == other); }

private:
  Type type_ = Type::Null;
  bool bool_ = false;
  std::int64_t int_ = 0;
  double number_ = 0.0;
  std::string string_;
  Array array_;
  Object object_;
};

/// Escape a string for embedding inside a JSON string literal (RFC 8259 rules).
[[nodiscard]] std::string json_escape(const std::string &value);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Strict parse of a complete document. Errors carry a byte offset but never echo
/// document content.
[[nodiscard]] Result<JsonValue> parse_json(const std::string &text, std::size_t max_depth = 64);

/// Deterministic encoding: sorted keys, no insignificant whitespace, integers as
/// integers and doubles always with a fraction or exponent.
[[nodiscard]] std::string to_canonical_json(const JsonValue &value);

} // namespace cairn::common
