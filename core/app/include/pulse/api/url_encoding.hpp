#pragma once

#include <string>

namespace pulse {
namespace api {

// RFC 3986 percent-encoding. Unreserved characters (A-Z a-z 0-9 - _ . ~)
// pass through; everything else, including ',' and '/', becomes %XX.
std::string percentEncode(const std::string& text);

}  // namespace api
}  // namespace pulse
