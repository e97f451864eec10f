#ifndef JSONCHECK_CORE_JSON_UTILS_HPP_
#define JSONCHECK_CORE_JSON_UTILS_HPP_

#include <string>
#include <string_view>

namespace jsoncheck::core {

// Appends `input` to `out` as the body of a JSON string literal (no quotes).
// Control characters without a short escape are written as \u00XX.
inline void AppendEscapedJson(std::string& out, std::string_view input) {
  static constexpr char kHexDigits[] = "0123456789abcdef";
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out += "\\u00";
        out.push_back(kHexDigits[as_unsigned >> 4U]);
        out.push_back(kHexDigits[as_unsigned & 0x0FU]);
      } else {
        out.push_back(ch);
      }
      break;
    }
    }
  }
}

inline std::string EscapeJson(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  AppendEscapedJson(out, input);
  return out;
}

// Quoted JSON string literal.
inline std::string QuoteJson(std::string_view input) {
  std::string out;
  out.reserve(input.size() + 2U);
  out.push_back('"');
  AppendEscapedJson(out, input);
  out.push_back('"');
  return out;
}

} // namespace jsoncheck::core

#endif // JSONCHECK_CORE_JSON_UTILS_HPP_
