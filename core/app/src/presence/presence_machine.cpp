#include "pulse/presence/presence_machine.hpp"

namespace pulse {
namespace presence {

std::optional<EffectChannel> Machine::channelOf(const Effect& effect) {
  if (std::holds_alternative<effect::Heartbeat>(effect)) {
    return EffectChannel::Heartbeat;
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
    case S::HeartbeatInactive: return "HeartbeatInactive";
    case S::Heartbeating:      return "Heartbeating";
    case S::HeartbeatCooldown: return "HeartbeatCooldown";
    case S::HeartbeatFailed:   return "HeartbeatFailed";
    case S::HeartbeatStopped:  return "HeartbeatStopped";
  }
  return "Unknown";
}

const char* eventName(const Event& event) {
  static constexpr const char* kNames[] = {
      "Joined",           "Left",    "LeftAll", "Disconnect", "Reconnect",
      "HeartbeatSuccess", "HeartbeatFailure",   "TimesUp",    "Retry",
  };
  return kNames[event.index()];
}

const char* effectName(const Effect& effect) {
  static constexpr const char* kNames[] = {
      "Heartbeat", "Leave", "EmitHeartbeatStatus", "Wait", "CancelPrevious",
  };
  return kNames[effect.index()];
}

}  // namespace presence
}  // namespace pulse
