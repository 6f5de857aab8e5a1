#ifndef SKILLBENCH_CORE_JSON_DOM_HPP_
#define SKILLBENCH_CORE_JSON_DOM_HPP_

#include "core/json_utils.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace skillbench::core::json {

// Minimal DOM shared by project config rewrites, record loading and oracle
// structured-output parsing. Every persisted document is read and replaced
// whole, so the DOM must round-trip fields it does not know about.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;

  bool is_object() const {
    return type == Type::kObject;
  }
  bool is_array() const {
    return type == Type::kArray;
  }
  bool is_string() const {
    return type == Type::kString;
  }
  bool is_number() const {
    return type == Type::kNumber;
  }
  bool is_null() const {
    return type == Type::kNull;
  }
};

inline Value MakeObject() {
  Value value;
  value.type = Value::Type::kObject;
  return value;
}

inline Value MakeArray() {
  Value value;
  value.type = Value::Type::kArray;
  return value;
}

inline Value MakeString(std::string text) {
  Value value;
  value.type = Value::Type::kString;
  value.string_value = std::move(text);
  return value;
}

inline Value MakeNumber(double number) {
  Value value;
  value.type = Value::Type::kNumber;
  value.number_value = number;
  return value;
}

inline Value MakeBool(bool flag) {
  Value value;
  value.type = Value::Type::kBool;
  value.bool_value = flag;
  return value;
}

inline Value MakeNull() {
  return Value{};
}

// Lightweight JSON parser with deterministic diagnostics.
// Errors report line/column so malformed documents and model output are
// actionable in logs.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  bool ParseValue(Value& value, std::string& error) {
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    const char c = Peek();
    if (c == '{') {
      return ParseObject(value, error);
    }
    if (c == '[') {
      return ParseArray(value, error);
    }
    if (c == '"') {
      value = Value{};
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value = Value{};
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    if (StartsWith("true")) {
      value = MakeBool(true);
      AdvanceN(4);
      return true;
    }
    if (StartsWith("false")) {
      value = MakeBool(false);
      AdvanceN(5);
      return true;
    }
    if (StartsWith("null")) {
      value = MakeNull();
      AdvanceN(4);
      return true;
    }

    return Fail("expected JSON value", error);
  }

  bool ParseObject(Value& value, std::string& error) {
    value = MakeObject();

    if (!ConsumeChar('{', "expected '{' to start object", error)) {
      return false;
    }
    SkipWhitespace();

    if (Match('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }

      SkipWhitespace();
      if (!ConsumeChar(':', "expected ':' after object key", error)) {
        return false;
      }

      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.object_value[key] = std::move(item);

      SkipWhitespace();
      if (Match('}')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between object entries", error)) {
        return false;
      }
    }

    return true;
  }

  bool ParseArray(Value& value, std::string& error) {
    value = MakeArray();

    if (!ConsumeChar('[', "expected '[' to start array", error)) {
      return false;
    }
    SkipWhitespace();

    if (Match(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between array items", error)) {
        return false;
      }
    }

    return true;
  }

  bool ParseHex4(std::uint32_t& code_unit, std::string& error) {
    code_unit = 0;
    for (int i = 0; i < 4; ++i) {
      if (AtEnd()) {
        return Fail("truncated \\u escape sequence", error);
      }
      const char h = Advance();
      code_unit <<= 4U;
      if (h >= '0' && h <= '9') {
        code_unit |= static_cast<std::uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code_unit |= static_cast<std::uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code_unit |= static_cast<std::uint32_t>(h - 'A' + 10);
      } else {
        return Fail("invalid hex digit in \\u escape sequence", error);
      }
    }
    return true;
  }

  static void AppendUtf8(std::uint32_t code_point, std::string& output) {
    if (code_point < 0x80U) {
      output.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800U) {
      output.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else if (code_point < 0x10000U) {
      output.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else {
      output.push_back(static_cast<char>(0xF0U | (code_point >> 18U)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 12U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    }
  }

  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    std::uint32_t high = 0;
    if (!ParseHex4(high, error)) {
      return false;
    }
    if (high >= 0xD800U && high <= 0xDBFFU) {
      if (!StartsWith("\\u")) {
        return Fail("unpaired high surrogate in \\u escape", error);
      }
      AdvanceN(2);
      std::uint32_t low = 0;
      if (!ParseHex4(low, error)) {
        return false;
      }
      if (low < 0xDC00U || low > 0xDFFFU) {
        return Fail("invalid low surrogate in \\u escape", error);
      }
      AppendUtf8(0x10000U + ((high - 0xD800U) << 10U) + (low - 0xDC00U), output);
      return true;
    }
    if (high >= 0xDC00U && high <= 0xDFFFU) {
      return Fail("unpaired low surrogate in \\u escape", error);
    }
    AppendUtf8(high, output);
    return true;
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    if (!ConsumeChar('"', "expected '\"' to start string", error)) {
      return false;
    }

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (c == '\\') {
        if (AtEnd()) {
          return Fail("unterminated escape sequence in string", error);
        }
        const char esc = Advance();
        switch (esc) {
        case '"':
        case '\\':
        case '/':
          output.push_back(esc);
          break;
        case 'b':
          output.push_back('\b');
          break;
        case 'f':
          output.push_back('\f');
          break;
        case 'n':
          output.push_back('\n');
          break;
        case 'r':
          output.push_back('\r');
          break;
        case 't':
          output.push_back('\t');
          break;
        case 'u':
          if (!ParseUnicodeEscape(output, error)) {
            return false;
          }
          break;
        default:
          return Fail("invalid escape sequence in string", error);
        }
        continue;
      }

      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      output.push_back(c);
    }

    return Fail("unterminated string literal", error);
  }

  bool ParseNumber(double& output, std::string& error) {
    const std::size_t start = pos_;

    if (Match('-')) {
      // optional sign
    }

    if (Match('0')) {
      // single leading zero
    } else {
      if (!ConsumeDigits()) {
        return Fail("expected digits in number", error);
      }
    }

    if (Match('.')) {
      if (!ConsumeDigits()) {
        return Fail("expected digits after decimal point", error);
      }
    }

    if (Match('e') || Match('E')) {
      if (Match('+') || Match('-')) {
        // exponent sign
      }
      if (!ConsumeDigits()) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string text(input_.substr(start, pos_ - start));
    char* end = nullptr;
    output = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(output)) {
      return Fail("invalid numeric value", error);
    }

    return true;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool ConsumeDigits() {
    std::size_t count = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
      ++count;
    }
    return count > 0U;
  }

  bool ConsumeChar(char expected, std::string_view message, std::string& error) {
    if (AtEnd() || Peek() != expected) {
      return Fail(message, error);
    }
    Advance();
    return true;
  }

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
  }

  bool StartsWith(std::string_view token) const {
    if (pos_ + token.size() > input_.size()) {
      return false;
    }
    return input_.substr(pos_, token.size()) == token;
  }

  void AdvanceN(std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) {
      Advance();
    }
  }

  char Peek() const {
    return input_[pos_];
  }

  char Advance() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(col_) +
            ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

namespace detail {

inline void WriteEscapedString(std::ostringstream& out, std::string_view text) {
  out << '"' << EscapeJson(text) << '"';
}

inline void WriteNumber(std::ostringstream& out, double number) {
  out << FormatJsonNumber(number);
}

inline void WriteValue(std::ostringstream& out, const Value& value, int depth) {
  const std::string indent(static_cast<std::size_t>(depth + 1) * 2U, ' ');
  const std::string closing_indent(static_cast<std::size_t>(depth) * 2U, ' ');
  switch (value.type) {
  case Value::Type::kObject: {
    if (value.object_value.empty()) {
      out << "{}";
      return;
    }
    out << "{\n";
    bool first = true;
    for (const auto& [key, item] : value.object_value) {
      if (!first) {
        out << ",\n";
      }
      first = false;
      out << indent;
      WriteEscapedString(out, key);
      out << ": ";
      WriteValue(out, item, depth + 1);
    }
    out << '\n' << closing_indent << '}';
    return;
  }
  case Value::Type::kArray: {
    if (value.array_value.empty()) {
      out << "[]";
      return;
    }
    out << "[\n";
    for (std::size_t i = 0; i < value.array_value.size(); ++i) {
      if (i > 0) {
        out << ",\n";
      }
      out << indent;
      WriteValue(out, value.array_value[i], depth + 1);
    }
    out << '\n' << closing_indent << ']';
    return;
  }
  case Value::Type::kString:
    WriteEscapedString(out, value.string_value);
    return;
  case Value::Type::kNumber:
    WriteNumber(out, value.number_value);
    return;
  case Value::Type::kBool:
    out << (value.bool_value ? "true" : "false");
    return;
  case Value::Type::kNull:
    out << "null";
    return;
  }
}

} // namespace detail

// Pretty-prints with two-space indentation and a trailing newline. Object keys
// come out sorted because `Value::Object` is an ordered map.
inline std::string Serialize(const Value& value) {
  std::ostringstream out;
  detail::WriteValue(out, value, 0);
  out << '\n';
  return out.str();
}

inline const Value* FindField(const Value& object, std::string_view key) {
  if (object.type != Value::Type::kObject) {
    return nullptr;
  }
  const auto it = object.object_value.find(std::string(key));
  if (it == object.object_value.end()) {
    return nullptr;
  }
  return &it->second;
}

inline std::string GetString(const Value& object, std::string_view key,
                             std::string_view fallback = "") {
  const Value* field = FindField(object, key);
  if (field == nullptr || field->type != Value::Type::kString) {
    return std::string(fallback);
  }
  return field->string_value;
}

inline std::optional<double> GetNumber(const Value& object, std::string_view key) {
  const Value* field = FindField(object, key);
  if (field == nullptr || field->type != Value::Type::kNumber) {
    return std::nullopt;
  }
  return field->number_value;
}

inline double GetNumberOr(const Value& object, std::string_view key, double fallback) {
  return GetNumber(object, key).value_or(fallback);
}

inline std::vector<std::string> GetStringArray(const Value& object, std::string_view key) {
  std::vector<std::string> items;
  const Value* field = FindField(object, key);
  if (field == nullptr || field->type != Value::Type::kArray) {
    return items;
  }
  for (const auto& item : field->array_value) {
    if (item.type == Value::Type::kString) {
      items.push_back(item.string_value);
    }
  }
  return items;
}

} // namespace skillbench::core::json

#endif // SKILLBENCH_CORE_JSON_DOM_HPP_
