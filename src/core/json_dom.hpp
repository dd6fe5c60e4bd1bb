#ifndef CAMSNITCH_CORE_JSON_DOM_HPP_
#define CAMSNITCH_CORE_JSON_DOM_HPP_

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace camsnitch::core::json {

// Small STL-only DOM. Used to read the daemon config file and, in tests, to
// check the shape of published documents.
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

  bool IsObject() const {
    return type == Type::kObject;
  }
  bool IsArray() const {
    return type == Type::kArray;
  }
  bool IsString() const {
    return type == Type::kString;
  }
  bool IsNumber() const {
    return type == Type::kNumber;
  }
  bool IsBool() const {
    return type == Type::kBool;
  }

  // Member lookup; nullptr when this is not an object or the key is absent.
  const Value* Find(const std::string& key) const {
    if (type != Type::kObject) {
      return nullptr;
    }
    const auto it = object_value.find(key);
    return it == object_value.end() ? nullptr : &it->second;
  }
};

inline const char* TypeName(Value::Type type) {
  switch (type) {
  case Value::Type::kObject:
    return "object";
  case Value::Type::kArray:
    return "array";
  case Value::Type::kString:
    return "string";
  case Value::Type::kNumber:
    return "number";
  case Value::Type::kBool:
    return "bool";
  case Value::Type::kNull:
    return "null";
  }
  return "null";
}

// Recursive-descent parser. Errors carry line/column of the offending byte.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, 0U, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("trailing content after JSON document", error);
    }
    return true;
  }

private:
  static constexpr std::size_t kMaxDepth = 64U;

  bool ParseValue(Value& value, std::size_t depth, std::string& error) {
    if (depth > kMaxDepth) {
      return Fail("document nested too deeply", error);
    }
    if (AtEnd()) {
      return Fail("unexpected end of input", error);
    }

    value = Value{};
    switch (Peek()) {
    case '{':
      return ParseObject(value, depth, error);
    case '[':
      return ParseArray(value, depth, error);
    case '"':
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    case 't':
      return ParseLiteral("true", value, Value::Type::kBool, true, error);
    case 'f':
      return ParseLiteral("false", value, Value::Type::kBool, false, error);
    case 'n':
      return ParseLiteral("null", value, Value::Type::kNull, false, error);
    default:
      break;
    }

    if (Peek() == '-' || std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    return Fail("expected a JSON value", error);
  }

  bool ParseLiteral(std::string_view token, Value& value, Value::Type type, bool flag,
                    std::string& error) {
    if (input_.substr(pos_, token.size()) != token) {
      return Fail("invalid literal", error);
    }
    for (std::size_t i = 0; i < token.size(); ++i) {
      Advance();
    }
    value.type = type;
    value.bool_value = flag;
    return true;
  }

  bool ParseObject(Value& value, std::size_t depth, std::string& error) {
    value.type = Value::Type::kObject;
    Advance(); // '{'
    SkipWhitespace();
    if (Match('}')) {
      return true;
    }

    for (;;) {
      SkipWhitespace();
      if (AtEnd() || Peek() != '"') {
        return Fail("expected string key", error);
      }
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }
      SkipWhitespace();
      if (!Match(':')) {
        return Fail("expected ':' after key", error);
      }
      SkipWhitespace();
      Value member;
      if (!ParseValue(member, depth + 1U, error)) {
        return false;
      }
      value.object_value[key] = std::move(member);

      SkipWhitespace();
      if (Match('}')) {
        return true;
      }
      if (!Match(',')) {
        return Fail("expected ',' or '}' in object", error);
      }
    }
  }

  bool ParseArray(Value& value, std::size_t depth, std::string& error) {
    value.type = Value::Type::kArray;
    Advance(); // '['
    SkipWhitespace();
    if (Match(']')) {
      return true;
    }

    for (;;) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, depth + 1U, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        return true;
      }
      if (!Match(',')) {
        return Fail("expected ',' or ']' in array", error);
      }
    }
  }

  bool ParseString(std::string& out, std::string& error) {
    out.clear();
    Advance(); // opening quote

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("raw control character in string", error);
      }
      if (c != '\\') {
        out.push_back(c);
        continue;
      }

      if (AtEnd()) {
        break;
      }
      const char esc = Advance();
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
        std::uint32_t code_point = 0;
        if (!ParseHex4(code_point, error)) {
          return false;
        }
        // Surrogate pairs are not expected in config files.
        if (code_point >= 0xD800U && code_point <= 0xDFFFU) {
          return Fail("surrogate \\u escapes are not supported", error);
        }
        AppendUtf8(out, code_point);
        break;
      }
      default:
        return Fail("invalid escape sequence", error);
      }
    }

    return Fail("unterminated string", error);
  }

  bool ParseHex4(std::uint32_t& code_point, std::string& error) {
    code_point = 0;
    for (int i = 0; i < 4; ++i) {
      if (AtEnd()) {
        return Fail("truncated \\u escape", error);
      }
      const char c = Advance();
      code_point <<= 4U;
      if (c >= '0' && c <= '9') {
        code_point |= static_cast<std::uint32_t>(c - '0');
      } else if (c >= 'a' && c <= 'f') {
        code_point |= static_cast<std::uint32_t>(c - 'a' + 10);
      } else if (c >= 'A' && c <= 'F') {
        code_point |= static_cast<std::uint32_t>(c - 'A' + 10);
      } else {
        return Fail("invalid hex digit in \\u escape", error);
      }
    }
    return true;
  }

  static void AppendUtf8(std::string& out, std::uint32_t code_point) {
    if (code_point < 0x80U) {
      out.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800U) {
      out.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
      out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else {
      out.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
      out.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    }
  }

  bool ParseNumber(double& out, std::string& error) {
    const std::size_t start = pos_;
    Match('-');
    if (!Match('0') && !SkipDigits()) {
      return Fail("expected digits in number", error);
    }
    if (Match('.') && !SkipDigits()) {
      return Fail("expected digits after decimal point", error);
    }
    if (Match('e') || Match('E')) {
      if (!Match('+')) {
        Match('-');
      }
      if (!SkipDigits()) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string text(input_.substr(start, pos_ - start));
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
      return Fail("invalid number", error);
    }
    return true;
  }

  bool SkipDigits() {
    const std::size_t start = pos_;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
    return pos_ > start;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
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
    error = "JSON parse error at line " + std::to_string(line_) + ", col " +
            std::to_string(col_) + ": " + std::string(message);
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

} // namespace camsnitch::core::json

#endif // CAMSNITCH_CORE_JSON_DOM_HPP_
