#ifndef RSA_CORE_JSON_UTILS_HPP_
#define RSA_CORE_JSON_UTILS_HPP_

#include "core/linalg.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace rsa::core {

// Shared escaping for every JSON writer in the tree.
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

// JSON has no NaN/Inf literals; non-finite values are written as null.
inline std::string FormatJsonNumber(double value) {
  if (!std::isfinite(value)) {
    return "null";
  }
  std::ostringstream out;
  out << std::setprecision(10) << value;
  return out.str();
}

inline std::string FormatJsonArray(const Vector& values) {
  std::string out = "[";
  for (Eigen::Index i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += FormatJsonNumber(values[i]);
  }
  out += "]";
  return out;
}

inline std::string Quoted(std::string_view raw) {
  return "\"" + EscapeJson(raw) + "\"";
}

} // namespace rsa::core

#endif // RSA_CORE_JSON_UTILS_HPP_
