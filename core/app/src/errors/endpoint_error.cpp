#include "pulse/errors/endpoint_error.hpp"

namespace pulse {

const char* toString(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::Transport:     return "Transport";
    case ErrorCategory::Server:        return "Server";
    case ErrorCategory::Cancellation:  return "Cancellation";
    case ErrorCategory::Configuration: return "Configuration";
  }
  return "Unknown";
}

std::string describe(const EndpointError& error) {
  std::string text = toString(error.category);
  if (error.category == ErrorCategory::Server) {
    text += "(" + std::to_string(error.status_code) + ")";
  }
  if (!error.message.empty()) {
    text += ": " + error.message;
  }
  return text;
}

}  // namespace pulse
