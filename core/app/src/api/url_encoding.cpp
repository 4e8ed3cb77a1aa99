#include "pulse/api/url_encoding.hpp"

#include <cctype>

namespace pulse {
namespace api {

std::string percentEncode(const std::string& text) {
  static constexpr char kHex[] = "0123456789ABCDEF";

  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += kHex[c >> 4];
      out += kHex[c & 0x0F];
    }
  }
  return out;
}

}  // namespace api
}  // namespace pulse
