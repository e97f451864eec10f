#ifndef JSONCHECK_CORE_JSON_DOM_HPP_
#define JSONCHECK_CORE_JSON_DOM_HPP_

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace jsoncheck::core::json {

// Parsed JSON node. The kind set is closed; `type` selects which payload field
// is meaningful. Every node remembers the byte range of its own source text so
// diagnostics can quote the document exactly as it was written.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  // Integral literals have no fraction or exponent part ("42"); everything
  // else ("42.0", "4e1") is fractional. Both compare as doubles.
  enum class NumberKind {
    kIntegral,
    kFractional,
  };

  struct Member;
  using Object = std::vector<Member>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  std::unordered_map<std::string, std::size_t> object_index;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  NumberKind number_kind = NumberKind::kIntegral;
  bool bool_value = false;
  std::size_t raw_offset = 0;
  std::size_t raw_length = 0;

  // Object member lookup. Returns nullptr for non-objects and absent keys.
  const Value* Find(std::string_view key) const;
};

struct Value::Member {
  std::string key;
  Value value;
};

inline const Value* Value::Find(std::string_view key) const {
  if (type != Type::kObject) {
    return nullptr;
  }
  const auto it = object_index.find(std::string(key));
  if (it == object_index.end()) {
    return nullptr;
  }
  return &object_value[it->second].value;
}

inline const char* ToString(Value::Type type) {
  switch (type) {
  case Value::Type::kObject:
    return "Object";
  case Value::Type::kArray:
    return "Array";
  case Value::Type::kString:
    return "String";
  case Value::Type::kNumber:
    return "Number";
  case Value::Type::kBool:
    return "Boolean";
  case Value::Type::kNull:
    return "Null";
  }

  return "Null";
}

// A parsed document owns its source text; raw slices of any node are served
// from it.
struct Document {
  std::string text;
  Value root;

  std::string_view RawText(const Value& value) const {
    return std::string_view(text).substr(value.raw_offset, value.raw_length);
  }
};

struct ParseError {
  std::size_t line = 0;
  std::size_t column = 0;
  std::string message;
};

inline std::string Describe(const ParseError& error) {
  return "parse error at line " + std::to_string(error.line) + ", col " +
         std::to_string(error.column) + ": " + error.message;
}

// Parsing and comparison both recurse once per nesting level; this bound
// keeps that recursion within a default thread stack.
inline constexpr std::size_t kMaxSupportedDepth = 4096;

struct ParseOptions {
  // Deepest allowed object/array nesting. The root container is depth 1.
  // Values above kMaxSupportedDepth are clamped to it.
  std::size_t max_depth = 64;
};

// Strict RFC 8259 parser with deterministic line/column diagnostics.
class Parser {
public:
  explicit Parser(std::string_view input, ParseOptions options = {})
      : input_(input), options_(options) {}

  bool Parse(Value& root, ParseError& error) {
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
  bool ParseValue(Value& value, ParseError& error) {
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    const std::size_t start = pos_;
    const char c = Peek();
    bool ok = false;
    if (c == '{') {
      ok = ParseObject(value, error);
    } else if (c == '[') {
      ok = ParseArray(value, error);
    } else if (c == '"') {
      value.type = Value::Type::kString;
      ok = ParseString(value.string_value, error);
    } else if (c == '-' || IsDigit(c)) {
      value.type = Value::Type::kNumber;
      ok = ParseNumber(value, error);
    } else if (StartsWith("true")) {
      value.type = Value::Type::kBool;
      value.bool_value = true;
      AdvanceN(4);
      ok = true;
    } else if (StartsWith("false")) {
      value.type = Value::Type::kBool;
      value.bool_value = false;
      AdvanceN(5);
      ok = true;
    } else if (StartsWith("null")) {
      value.type = Value::Type::kNull;
      AdvanceN(4);
      ok = true;
    } else {
      return Fail("expected JSON value", error);
    }

    if (!ok) {
      return false;
    }
    value.raw_offset = start;
    value.raw_length = pos_ - start;
    return true;
  }

  bool EnterContainer(ParseError& error) {
    ++depth_;
    const std::size_t limit = std::min(options_.max_depth, kMaxSupportedDepth);
    if (depth_ > limit) {
      return Fail("maximum nesting depth of " + std::to_string(limit) + " exceeded", error);
    }
    return true;
  }

  bool ParseObject(Value& value, ParseError& error) {
    value = Value{};
    value.type = Value::Type::kObject;

    if (!ConsumeChar('{', "expected '{' to start object", error)) {
      return false;
    }
    if (!EnterContainer(error)) {
      return false;
    }
    SkipWhitespace();

    if (Match('}')) {
      --depth_;
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

      // Last duplicate wins but keeps the slot of the first occurrence.
      const auto existing = value.object_index.find(key);
      if (existing != value.object_index.end()) {
        value.object_value[existing->second].value = std::move(item);
      } else {
        value.object_index.emplace(key, value.object_value.size());
        value.object_value.push_back({std::move(key), std::move(item)});
      }

      SkipWhitespace();
      if (Match('}')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between object entries", error)) {
        return false;
      }
    }

    --depth_;
    return true;
  }

  bool ParseArray(Value& value, ParseError& error) {
    value = Value{};
    value.type = Value::Type::kArray;

    if (!ConsumeChar('[', "expected '[' to start array", error)) {
      return false;
    }
    if (!EnterContainer(error)) {
      return false;
    }
    SkipWhitespace();

    if (Match(']')) {
      --depth_;
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

    --depth_;
    return true;
  }

  bool ParseString(std::string& output, ParseError& error) {
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

      const auto byte = static_cast<unsigned char>(c);
      if (byte < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      if (byte < 0x80U) {
        output.push_back(c);
        continue;
      }
      if (!ConsumeUtf8Continuation(byte, output, error)) {
        return false;
      }
    }

    return Fail("unterminated string literal", error);
  }

  bool ReadHex4(std::uint32_t& code_unit, ParseError& error) {
    code_unit = 0;
    for (int i = 0; i < 4; ++i) {
      if (AtEnd()) {
        return Fail("unterminated unicode escape in string", error);
      }
      const char c = Peek();
      std::uint32_t digit = 0;
      if (c >= '0' && c <= '9') {
        digit = static_cast<std::uint32_t>(c - '0');
      } else if (c >= 'a' && c <= 'f') {
        digit = static_cast<std::uint32_t>(c - 'a' + 10);
      } else if (c >= 'A' && c <= 'F') {
        digit = static_cast<std::uint32_t>(c - 'A' + 10);
      } else {
        return Fail("invalid hex digit in unicode escape", error);
      }
      Advance();
      code_unit = (code_unit << 4U) | digit;
    }
    return true;
  }

  // Called after "\u" has been consumed. Surrogate pairs must appear as two
  // consecutive escapes.
  bool ParseUnicodeEscape(std::string& output, ParseError& error) {
    std::uint32_t code_point = 0;
    if (!ReadHex4(code_point, error)) {
      return false;
    }

    if (code_point >= 0xDC00U && code_point <= 0xDFFFU) {
      return Fail("unpaired low surrogate in unicode escape", error);
    }
    if (code_point >= 0xD800U && code_point <= 0xDBFFU) {
      if (!StartsWith("\\u")) {
        return Fail("unpaired high surrogate in unicode escape", error);
      }
      AdvanceN(2);
      std::uint32_t low = 0;
      if (!ReadHex4(low, error)) {
        return false;
      }
      if (low < 0xDC00U || low > 0xDFFFU) {
        return Fail("invalid low surrogate in unicode escape", error);
      }
      code_point = 0x10000U + ((code_point - 0xD800U) << 10U) + (low - 0xDC00U);
    }

    AppendUtf8(code_point, output);
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

  // Validates one multi-byte UTF-8 sequence whose lead byte was just consumed.
  // Overlong forms, surrogates and code points past U+10FFFF are rejected.
  bool ConsumeUtf8Continuation(unsigned char lead, std::string& output, ParseError& error) {
    std::size_t continuation_count = 0;
    std::uint32_t code_point = 0;
    std::uint32_t min_code_point = 0;
    if ((lead & 0xE0U) == 0xC0U) {
      continuation_count = 1;
      code_point = lead & 0x1FU;
      min_code_point = 0x80U;
    } else if ((lead & 0xF0U) == 0xE0U) {
      continuation_count = 2;
      code_point = lead & 0x0FU;
      min_code_point = 0x800U;
    } else if ((lead & 0xF8U) == 0xF0U) {
      continuation_count = 3;
      code_point = lead & 0x07U;
      min_code_point = 0x10000U;
    } else {
      return Fail("invalid UTF-8 lead byte in string", error);
    }

    output.push_back(static_cast<char>(lead));
    for (std::size_t i = 0; i < continuation_count; ++i) {
      if (AtEnd()) {
        return Fail("truncated UTF-8 sequence in string", error);
      }
      const auto next = static_cast<unsigned char>(Peek());
      if ((next & 0xC0U) != 0x80U) {
        return Fail("invalid UTF-8 continuation byte in string", error);
      }
      Advance();
      code_point = (code_point << 6U) | (next & 0x3FU);
      output.push_back(static_cast<char>(next));
    }

    if (code_point < min_code_point || code_point > 0x10FFFFU ||
        (code_point >= 0xD800U && code_point <= 0xDFFFU)) {
      return Fail("invalid UTF-8 sequence in string", error);
    }
    return true;
  }

  bool ParseNumber(Value& value, ParseError& error) {
    const std::size_t start = pos_;
    bool fractional = false;

    if (Match('-')) {
      // optional sign
    }

    if (Match('0')) {
      if (!AtEnd() && IsDigit(Peek())) {
        return Fail("leading zeros are not allowed in numbers", error);
      }
    } else {
      if (!ConsumeDigits()) {
        return Fail("expected digits in number", error);
      }
    }

    if (Match('.')) {
      fractional = true;
      if (!ConsumeDigits()) {
        return Fail("expected digits after decimal point", error);
      }
    }

    if (Match('e') || Match('E')) {
      fractional = true;
      if (Match('+') || Match('-')) {
        // exponent sign
      }
      if (!ConsumeDigits()) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string text(input_.substr(start, pos_ - start));
    char* parse_end = nullptr;
    const double parsed = std::strtod(text.c_str(), &parse_end);
    if (parse_end == nullptr || *parse_end != '\0') {
      return Fail("invalid number token", error);
    }
    if (!std::isfinite(parsed)) {
      return Fail("number is out of range for a double: " + text, error);
    }

    value.number_value = parsed;
    value.number_kind = fractional ? Value::NumberKind::kFractional : Value::NumberKind::kIntegral;
    return true;
  }

  static bool IsDigit(char c) {
    return c >= '0' && c <= '9';
  }

  static bool IsWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
  }

  void SkipWhitespace() {
    while (!AtEnd() && IsWhitespace(Peek())) {
      Advance();
    }
  }

  bool ConsumeDigits() {
    std::size_t count = 0;
    while (!AtEnd() && IsDigit(Peek())) {
      Advance();
      ++count;
    }
    return count > 0U;
  }

  bool ConsumeChar(char expected, std::string_view message, ParseError& error) {
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

  bool Fail(std::string_view message, ParseError& error) const {
    error.line = line_;
    error.column = col_;
    error.message = std::string(message);
    return false;
  }

  std::string_view input_;
  ParseOptions options_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
  std::size_t depth_ = 0;
};

inline bool Parse(std::string_view input, Value& root, ParseError& error,
                  ParseOptions options = {}) {
  Parser parser(input, options);
  return parser.Parse(root, error);
}

// Takes ownership of `text` so raw slices stay valid for the document's life.
inline bool Parse(std::string text, Document& document, ParseError& error,
                  ParseOptions options = {}) {
  document.text = std::move(text);
  document.root = Value{};
  Parser parser(document.text, options);
  return parser.Parse(document.root, error);
}

} // namespace jsoncheck::core::json

#endif // JSONCHECK_CORE_JSON_DOM_HPP_
