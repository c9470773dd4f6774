/***
 * Name: pytgen::support::JsonEscape
 * Purpose: Escape text for a JSON string literal.
 */
#include "pytgen/support/json.h"

#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>

namespace pytgen {
namespace support {

std::string JsonEscape(const std::string& str) {  // NOLINT(readability-function-size)
  std::string out;
  constexpr std::size_t kReservePadding = 8;
  out.reserve(str.size() + kReservePadding);
  for (const unsigned char uchar : str) {
    switch (uchar) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        constexpr unsigned char kMinPrintable = 0x20;
        if (uchar < kMinPrintable) {
          std::ostringstream hex;
          hex << "\\u" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
              << static_cast<int>(uchar);
          out += hex.str();
        } else {
          out += static_cast<char>(uchar);
        }
    }
  }
  return out;
}

}  // namespace support
}  // namespace pytgen
