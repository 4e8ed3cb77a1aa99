#include "pulse/domain/status.hpp"

namespace pulse {
namespace domain {

const char* toString(StatusCategory category) {
  using C = StatusCategory;
  switch (category) {
    case C::Connected:                return "Connected";
    case C::Reconnected:              return "Reconnected";
    case C::Reconnecting:             return "Reconnecting";
    case C::Disconnected:             return "Disconnected";
    case C::DisconnectedUnexpectedly: return "DisconnectedUnexpectedly";
    case C::ConnectionError:          return "ConnectionError";
    case C::SubscriptionChanged:      return "SubscriptionChanged";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace pulse
