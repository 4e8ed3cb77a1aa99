#include "pulse/transport/request.hpp"

namespace pulse {
namespace transport {

std::string Request::url() const {
  std::string out = path;
  char separator = '?';
  for (const auto& [key, value] : query) {
    out += separator;
    out += key;
    out += '=';
    out += value;
    separator = '&';
  }
  return out;
}

std::string Request::queryValue(const std::string& key) const {
  for (const auto& [k, v] : query) {
    if (k == key) {
      return v;
    }
  }
  return {};
}

bool Request::hasQuery(const std::string& key) const {
  for (const auto& entry : query) {
    if (entry.first == key) {
      return true;
    }
  }
  return false;
}

}  // namespace transport
}  // namespace pulse
