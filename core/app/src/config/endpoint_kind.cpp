#include "pulse/config/endpoint_kind.hpp"

namespace pulse {

const char* toString(EndpointKind kind) {
  switch (kind) {
    case EndpointKind::Subscribe: return "subscribe";
    case EndpointKind::Heartbeat: return "heartbeat";
    case EndpointKind::Leave:     return "leave";
  }
  return "unknown";
}

std::optional<EndpointKind> endpointKindFromString(const std::string& text) {
  if (text == "subscribe") return EndpointKind::Subscribe;
  if (text == "heartbeat") return EndpointKind::Heartbeat;
  if (text == "leave") return EndpointKind::Leave;
  return std::nullopt;
}

}  // namespace pulse
