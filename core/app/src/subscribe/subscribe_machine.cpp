#include "pulse/subscribe/subscribe_machine.hpp"

namespace pulse {
namespace subscribe {

std::optional<EffectChannel> Machine::channelOf(const Effect& effect) {
  if (std::holds_alternative<effect::Handshake>(effect) ||
      std::holds_alternative<effect::HandshakeReconnect>(effect)) {
    return EffectChannel::Handshake;
  }
  if (std::holds_alternative<effect::ReceiveMessages>(effect) ||
      std::holds_alternative<effect::ReceiveReconnect>(effect)) {
    return EffectChannel::Receive;
  }
  if (const auto* wait = std::get_if<effect::Wait>(&effect)) {
    return wait->channel;
  }
  return std::nullopt;
}

std::optional<EffectChannel> Machine::cancelTargetOf(const Effect& effect) {
  if (const auto* cancel = std::get_if<effect::CancelPrevious>(&effect)) {
    return cancel->channel;
  }
  return std::nullopt;
}

const char* toString(StateKind kind) {
  using S = StateKind;
  switch (kind) {
    case S::Unsubscribed:     return "Unsubscribed";
    case S::Handshaking:      return "Handshaking";
    case S::HandshakeFailed:  return "HandshakeFailed";
    case S::HandshakeStopped: return "HandshakeStopped";
    case S::Receiving:        return "Receiving";
    case S::ReceiveFailed:    return "ReceiveFailed";
    case S::ReceiveStopped:   return "ReceiveStopped";
  }
  return "Unknown";
}

const char* toString(EffectChannel channel) {
  return channel == EffectChannel::Handshake ? "Handshake" : "Receive";
}

const char* eventName(const Event& event) {
  static constexpr const char* kNames[] = {
      "SubscriptionChange", "Restore",        "HandshakeSuccess",
      "HandshakeFailure",   "ReceiveSuccess", "ReceiveFailure",
      "Disconnect",         "Reconnect",      "Retry",
  };
  return kNames[event.index()];
}

const char* effectName(const Effect& effect) {
  static constexpr const char* kNames[] = {
      "Handshake",    "HandshakeReconnect", "ReceiveMessages",
      "ReceiveReconnect", "EmitMessages",   "EmitStatus",
      "Wait",         "CancelPrevious",
  };
  return kNames[effect.index()];
}

}  // namespace subscribe
}  // namespace pulse
