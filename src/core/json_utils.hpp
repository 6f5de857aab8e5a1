#ifndef SKILLBENCH_CORE_JSON_UTILS_HPP_
#define SKILLBENCH_CORE_JSON_UTILS_HPP_

#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace skillbench::core {

// String body escaping shared by the DOM serializer.
inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

// Scores are kept to one decimal in summaries; integral values print without
// a fractional part so `85` stays `85`.
inline std::string FormatJsonNumber(double value) {
  if (!std::isfinite(value)) {
    return "0";
  }
  if (std::floor(value) == value && std::fabs(value) < 9.0e15) {
    return std::to_string(static_cast<long long>(value));
  }
  std::ostringstream out;
  out << std::setprecision(15) << value;
  return out.str();
}

} // namespace skillbench::core

#endif // SKILLBENCH_CORE_JSON_UTILS_HPP_
