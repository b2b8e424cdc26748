#include "cairn/common/json.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <stdexcept>

namespace cairn::common {

namespace {

class Parser {
public:
  Parser(const std::string &text, std::size_t max_depth) : text_(text), max_depth_(max_depth) {}

  Result<JsonValue> run() {
    pos_ = json_skip_ws(text_, 0);
    JsonValue root;
    if (!parse_value(root, 0)) {
      return Result<JsonValue>::failure(error_);
    }
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ != text_.size()) {
      return Result<JsonValue>::failure(fail("trailing characters"));
    }
    return Result<JsonValue>::success(std::move(root));
  }

private:
  std::string fail(const std::string &what) {
    error_ = what + " at offset " + std::to_string(pos_);
    return error_;
  }

  bool consume_literal(const char *literal) {
    std::size_t i = 0;
    for (; literal[i] != '\0'; ++i) {
      if (pos_ + i >= text_.size() || text_[pos_ + i] != literal[i]) {
        fail("invalid literal");
        return false;
      }
    }
    pos_ += i;
    return true;
  }

  bool parse_value(JsonValue &out, const std::size_t depth) {
    if (depth > max_depth_) {
      fail("nesting too deep");
      return false;
    }
    if (pos_ >= text_.size()) {
      fail("unexpected end of input");
      return false;
    }
    switch (text_[pos_]) {
    case '{':
      return parse_object(out, depth);
    case '[':
      return parse_array(out, depth);
    case '"': {
      std::string value;
      if (!parse_string(value)) {
        return false;
      }
      out = JsonValue::string(std::move(value));
      return true;
    }
    case 't':
      if (!consume_literal("true")) {
        return false;
      }
      out = JsonValue::boolean(true);
      return true;
    case 'f':
      if (!consume_literal("false")) {
        return false;
      }
      out = JsonValue::boolean(false);
      return true;
    case 'n':
      if (!consume_literal("null")) {
        return false;
      }
      out = JsonValue::null();
      return true;
    default:
      return parse_number(out);
    }
  }

  bool parse_object(JsonValue &out, const std::size_t depth) {
    ++pos_;
    JsonValue::Object members;
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      out = JsonValue::object(std::move(members));
      return true;
    }
    while (true) {
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size() || text_[pos_] != '"') {
        fail("expected object key");
        return false;
      }
      std::string key;
      if (!parse_string(key)) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size() || text_[pos_] != ':') {
        fail("expected ':'");
        return false;
      }
      pos_ = json_skip_ws(text_, pos_ + 1);
      JsonValue value;
      if (!parse_value(value, depth + 1)) {
        return false;
      }
      if (members.count(key) != 0) {
        fail("duplicate object key");
        return false;
      }
      members.emplace(std::move(key), std::move(value));
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size()) {
        fail("unterminated object");
        return false;
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == '}') {
        ++pos_;
        out = JsonValue::object(std::move(members));
        return true;
      }
      fail("expected ',' or '}'");
      return false;
    }
  }

  bool parse_array(JsonValue &out, const std::size_t depth) {
    ++pos_;
    JsonValue::Array items;
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      out = JsonValue::array(std::move(items));
      return true;
    }
    while (true) {
      pos_ = json_skip_ws(text_, pos_);
      JsonValue value;
      if (!parse_value(value, depth + 1)) {
        return false;
      }
      items.push_back(std::move(value));
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size()) {
        fail("unterminated array");
        return false;
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == ']') {
        ++pos_;
        out = JsonValue::array(std::move(items));
        return true;
      }
      fail("expected ',' or ']'");
      return false;
    }
  }

  bool parse_hex4(std::uint32_t &out) {
    if (pos_ + 4 > text_.size()) {
      fail("truncated unicode escape");
      return false;
    }
    const char *first = text_.data() + pos_;
    auto [ptr, ec] = std::from_chars(first, first + 4, out, 16);
    if (ec != std::errc() || ptr != first + 4) {
      fail("invalid unicode escape");
      return false;
    }
    pos_ += 4;
    return true;
  }

  static void append_utf8(std::string &out, const std::uint32_t cp) {
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  bool parse_string(std::string &out) {
    ++pos_;
    while (pos_ < text_.size()) {
      const char ch = text_[pos_];
      if (ch == '"') {
        ++pos_;
        return true;
      }
      if (static_cast<unsigned char>(ch) < 0x20) {
        fail("control character in string");
        return false;
      }
      if (ch != '\\') {
        out.push_back(ch);
        ++pos_;
        continue;
      }
      ++pos_;
      if (pos_ >= text_.size()) {
        break;
      }
      const char esc = text_[pos_++];
      switch (esc) {
      case '"':
      case '\\':
      case '/':
        out.push_back(esc);
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'u': {
        std::uint32_t cp = 0;
        if (!parse_hex4(cp)) {
          return false;
        }
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          std::uint32_t low = 0;
          if (pos_ + 2 > text_.size() || text_[pos_] != '\\' || text_[pos_ + 1] != 'u') {
            fail("unpaired surrogate");
            return false;
          }
          pos_ += 2;
          if (!parse_hex4(low) || low < 0xDC00 || low > 0xDFFF) {
            fail("unpaired surrogate");
            return false;
          }
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
          fail("unpaired surrogate");
          return false;
        }
        append_utf8(out, cp);
        break;
      }
      default:
        fail("invalid escape");
        return false;
      }
    }
    fail("unterminated string");
    return false;
  }

  bool parse_number(JsonValue &out) {
    const std::size_t start = pos_;
    bool is_float = false;
    if (pos_ < text_.size() && text_[pos_] == '-') {
      ++pos_;
    }
    const std::size_t int_start = pos_;
    while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') {
      ++pos_;
    }
    if (pos_ == int_start) {
      fail("invalid value");
      return false;
    }
    if (text_[int_start] == '0' && pos_ - int_start > 1) {
      fail("leading zero in number");
      return false;
    }
    if (pos_ < text_.size() && text_[pos_] == '.') {
      is_float = true;
      ++pos_;
      const std::size_t frac_start = pos_;
      while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') {
        ++pos_;
      }
      if (pos_ == frac_start) {
        fail("invalid fraction");
        return false;
      }
    }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      is_float = true;
      ++pos_;
      if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) {
        ++pos_;
      }
      const std::size_t exp_start = pos_;
      while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') {
        ++pos_;
      }
      if (pos_ == exp_start) {
        fail("invalid exponent");
        return false;
      }
    }

    const char *first = text_.data() + start;
    const char *last = text_.data() + pos_;
    if (!is_float) {
      std::int64_t value = 0;
      auto [ptr, ec] = std::from_chars(first, last, value);
      if (ec == std::errc() && ptr == last) {
        out = JsonValue::integer(value);
        return true;
      }
      // Out of int64 range: fall through to double.
    }
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || !std::isfinite(value)) {
      fail("number out of range");
      return false;
    }
    out = JsonValue::number(value);
    return true;
  }

  const std::string &text_;
  std::size_t max_depth_;
  std::size_t pos_ = 0;
  std::string error_;
};

void write_canonical(const JsonValue &value, std::string &out) {
  switch (value.type()) {
  case JsonValue::Type::Null:
    out += "null";
    break;
  case JsonValue::Type::Bool:
    out += value.as_bool() ? "true" : "false";
    break;
  case JsonValue::Type::Integer:
    out += std::to_string(value.as_integer());
    break;
  case JsonValue::Type::Number: {
    const double number = value.as_double();
    if (!std::isfinite(number)) {
      out += "null";
      break;
    }
    std::array<char, 64> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), number);
    std::string text(buffer.data(), ec == std::errc() ? ptr : buffer.data());
    if (text.find_first_of(".eE") == std::string::npos) {
      text += ".0";
    }
    out += text;
    break;
  }
  case JsonValue::Type::String:
    out.push_back('"');
    out += json_escape(value.as_string());
    out.push_back('"');
    break;
  case JsonValue::Type::Array: {
    out.push_back('[');
    bool first = true;
    for (const auto &item : value.as_array()) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      write_canonical(item, out);
    }
    out.push_back(']');
    break;
  }
  case JsonValue::Type::Object: {
    out.push_back('{');
    bool first = true;
    for (const auto &[key, member] : value.as_object()) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      out.push_back('"');
      out += json_escape(key);
      out += "\":";
      write_canonical(member, out);
    }
    out.push_back('}');
    break;
  }
  }
}

} // namespace

JsonValue JsonValue::boolean(const bool value) {
  JsonValue v;
  v.type_ = Type::Bool;
  v.bool_ = value;
  return v;
}

JsonValue JsonValue::integer(const std::int64_t value) {
  JsonValue v;
  v.type_ = Type::Integer;
  v.int_ = value;
  return v;
}

JsonValue JsonValue::number(const double value) {
  JsonValue v;
  v.type_ = Type::Number;
  v.number_ = value;
  return v;
}

JsonValue JsonValue::string(std::string value) {
  JsonValue v;
  v.type_ = Type::String;
  v.string_ = std::move(value);
  return v;
}

JsonValue JsonValue::array(Array items) {
  JsonValue v;
  v.type_ = Type::Array;
  v.array_ = std::move(items);
  return v;
}

JsonValue JsonValue::object(Object members) {
  JsonValue v;
  v.type_ = Type::Object;
  v.object_ = std::move(members);
  return v;
}

bool JsonValue::as_bool() const {
  if (type_ != Type::Bool) {
    throw std::logic_error("json value is not a bool");
  }
  return bool_;
}

std::int64_t JsonValue::as_integer() const {
  if (type_ != Type::Integer) {
    throw std::logic_error("json value is not an integer");
  }
  return int_;
}

double JsonValue::as_double() const {
  if (type_ == Type::Integer) {
    return static_cast<double>(int_);
  }
  if (type_ != Type::Number) {
    throw std::logic_error("json value is not a number");
  }
  return number_;
}

const std::string &JsonValue::as_string() const {
  if (type_ != Type::String) {
    throw std::logic_error("json value is not a string");
  }
  return string_;
}

const JsonValue::Array &JsonValue::as_array() const {
  if (type_ != Type::Array) {
    throw std::logic_error("json value is not an array");
  }
  return array_;
}

const JsonValue::Object &JsonValue::as_object() const {
  if (type_ != Type::Object) {
    throw std::logic_error("json value is not an object");
  }
  return object_;
}

const JsonValue *JsonValue::find(const std::string &key) const {
  if (type_ != Type::Object) {
    return nullptr;
  }
  const auto it = object_.find(key);
  return it == object_.end() ? nullptr : &it->second;
}

void JsonValue::set(const std::string &key, JsonValue value) {
  if (type_ != Type::Object) {
    throw std::logic_error("json value is not an object");
  }
  object_.insert_or_assign(key, std::move(value));
}

bool JsonValue::erase(const std::string &key) {
  if (type_ != Type::Object) {
    return false;
  }
  return object_.erase(key) > 0;
}

void JsonValue::push_back(JsonValue value) {
  if (type_ != Type::Array) {
    throw std::logic_error("json value is not an array");
  }
  array_.push_back(std::move(value));
}

bool JsonValue::operator==(const JsonValue &other) const {
  if (type_ != other.type_) {
    return false;
  }
  switch (type_) {
  case Type::Null:
    return true;
  case Type::Bool:
    return bool_ == other.bool_;
  case Type::Integer:
    return int_ == other.int_;
  case Type::Number:
    return number_ == other.number_;
  case Type::String:
    return string_ == other.string_;
  case Type::Array:
    return array_ == other.array_;
  case Type::Object:
    return object_ == other.object_;
  }
  return false;
}

std::string json_escape(const std::string &value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        const auto byte = static_cast<unsigned char>(ch);
        escaped += "\\u00";
        escaped.push_back(kHex[byte >> 4]);
        escaped.push_back(kHex[byte & 0x0F]);
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() &&
         (text[pos] == ' ' || text[pos] == '\n' || text[pos] == '\r' || text[pos] == '\t')) {
    ++pos;
  }
  return pos;
}

Result<JsonValue> parse_json(const std::string &text, const std::size_t max_depth) {
  Parser parser(text, max_depth);
  return parser.run();
}

std::string to_canonical_json(const JsonValue &value) {
  std::string out;
  write_canonical(value, out);
  return out;
}

} // namespace cairn::common
