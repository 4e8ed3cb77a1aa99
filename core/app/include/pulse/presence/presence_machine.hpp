#pragma once

#include "pulse/domain/channel_set.hpp"
#include "pulse/domain/status.hpp"
#include "pulse/errors/endpoint_error.hpp"
#include "pulse/event_engine/transition_table.hpp"

#include <chrono>
#include <optional>
#include <variant>

namespace pulse {
namespace presence {

// -----------------------------------------------------------------------------
// Presence state machine vocabulary
// -----------------------------------------------------------------------------
//
//   HeartbeatInactive ──Joined──► Heartbeating ──success──► HeartbeatCooldown
//                                  ▲    │                        │
//                                  │    └─failure, exhausted─► HeartbeatFailed
//                                  └────────TimesUp──────────────┘
//
//   Disconnect moves any active state to HeartbeatStopped; Reconnect brings
//   HeartbeatFailed/HeartbeatStopped back to Heartbeating. LeftAll returns
//   every state to HeartbeatInactive.
// -----------------------------------------------------------------------------
enum class StateKind {
  HeartbeatInactive,
  Heartbeating,
  HeartbeatCooldown,
  HeartbeatFailed,
  HeartbeatStopped,
};

struct Context {
  domain::ChannelSet channels;
  domain::ChannelSet groups;
  int attempts{0};
  std::optional<EndpointError> reason;
};

using State = event_engine::EngineState<StateKind, Context>;

namespace event {

struct Joined {
  domain::ChannelSet channels;
  domain::ChannelSet groups;
};

struct Left {
  domain::ChannelSet channels;
  domain::ChannelSet groups;
};

struct LeftAll {
  bool is_offline{false};
};

struct Disconnect {
  bool is_offline{false};
};

struct Reconnect {};

struct HeartbeatSuccess {};

struct HeartbeatFailure {
  EndpointError error;
};

// Cooldown elapsed.
struct TimesUp {};

// Retry wait elapsed.
struct Retry {};

}  // namespace event

// Alternative order must match EventKind.
using Event = std::variant<event::Joined, event::Left, event::LeftAll,
                           event::Disconnect, event::Reconnect,
                           event::HeartbeatSuccess, event::HeartbeatFailure,
                           event::TimesUp, event::Retry>;

enum class EventKind {
  Joined,
  Left,
  LeftAll,
  Disconnect,
  Reconnect,
  HeartbeatSuccess,
  HeartbeatFailure,
  TimesUp,
  Retry,
};

enum class EffectChannel {
  Heartbeat,
};

// What a finished Wait reports: TimesUp after a cooldown, Retry after a
// failure backoff.
enum class WaitReason {
  Cooldown,
  Retry,
};

namespace effect {

struct Heartbeat {
  domain::ChannelSet channels;
  domain::ChannelSet groups;
};

struct Leave {
  domain::ChannelSet channels;
  domain::ChannelSet groups;
};

struct EmitHeartbeatStatus {
  domain::HeartbeatStatus status;
};

struct Wait {
  EffectChannel channel{EffectChannel::Heartbeat};
  std::chrono::milliseconds delay{0};
  WaitReason reason{WaitReason::Cooldown};
};

struct CancelPrevious {
  EffectChannel channel{EffectChannel::Heartbeat};
};

}  // namespace effect

using Effect = std::variant<effect::Heartbeat, effect::Leave,
                            effect::EmitHeartbeatStatus, effect::Wait,
                            effect::CancelPrevious>;

struct Machine {
  using StateKind = presence::StateKind;
  using Context = presence::Context;
  using State = presence::State;
  using Event = presence::Event;
  using EventKind = presence::EventKind;
  using Effect = presence::Effect;
  using EffectChannel = presence::EffectChannel;

  static EventKind kindOf(const Event& event) {
    return static_cast<EventKind>(event.index());
  }

  // Heartbeat and Wait run on the Heartbeat channel. Leave is unmanaged: it
  // must go out even though the heartbeat it follows is being cancelled.
  static std::optional<EffectChannel> channelOf(const Effect& effect);
  static std::optional<EffectChannel> cancelTargetOf(const Effect& effect);
};

const char* toString(StateKind kind);
const char* eventName(const Event& event);
const char* effectName(const Effect& effect);

}  // namespace presence
}  // namespace pulse
