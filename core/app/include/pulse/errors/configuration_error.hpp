#pragma once

#include <stdexcept>
#include <string>

namespace pulse {

// Thrown synchronously for invalid configuration or invalid arguments to a
// client call. No event is sent to any engine when this is thrown.
class ConfigurationError : public std::invalid_argument {
 public:
  explicit ConfigurationError(const std::string& what)
      : std::invalid_argument(what) {}
};

}  // namespace pulse
