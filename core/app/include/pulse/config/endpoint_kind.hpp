#pragma once

#include <optional>
#include <string>

namespace pulse {

// Endpoint families the engines call. Used by the retry policy to honour
// excluded endpoints and by the transport to label requests.
enum class EndpointKind {
  Subscribe,
  Heartbeat,
  Leave,
};

const char* toString(EndpointKind kind);

// "subscribe" / "heartbeat" / "leave" (case-sensitive). nullopt otherwise.
std::optional<EndpointKind> endpointKindFromString(const std::string& text);

}  // namespace pulse
