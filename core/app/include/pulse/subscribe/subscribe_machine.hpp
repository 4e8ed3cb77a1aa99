#pragma once

#include "pulse/domain/channel_set.hpp"
#include "pulse/domain/cursor.hpp"
#include "pulse/domain/message.hpp"
#include "pulse/domain/status.hpp"
#include "pulse/errors/endpoint_error.hpp"
#include "pulse/event_engine/transition_table.hpp"

#include <chrono>
#include <optional>
#include <variant>
#include <vector>

namespace pulse {
namespace subscribe {

// -----------------------------------------------------------------------------
// Subscription state machine vocabulary
// -----------------------------------------------------------------------------
//
//   Unsubscribed ──change──► Handshaking ──HandshakeSuccess──► Receiving
//                                 │                               │
//                    failure, retries exhausted     failure, retries exhausted
//                                 ▼                               ▼
//                          HandshakeFailed                  ReceiveFailed
//
//   Disconnect: Handshaking → HandshakeStopped, Receiving → ReceiveStopped,
//               *Failed → matching *Stopped.
//   Reconnect:  Handshake{Failed,Stopped} → Handshaking,
//               Receive{Failed,Stopped}   → Receiving (last cursor, no
//               handshake).
//   A SubscriptionChange or Restore is accepted in every state. With empty
//   channels and groups it leads to Unsubscribed, otherwise to Handshaking.
// -----------------------------------------------------------------------------
enum class StateKind {
  Unsubscribed,
  Handshaking,
  HandshakeFailed,
  HandshakeStopped,
  Receiving,
  ReceiveFailed,
  ReceiveStopped,
};

// Immutable per-state data. `attempts` counts retries in the current failure
// streak; `reason` is the last failure.
struct Context {
  domain::ChannelSet channels;
  domain::ChannelSet groups;
  std::optional<domain::Cursor> cursor;
  int attempts{0};
  std::optional<EndpointError> reason;
};

using State = event_engine::EngineState<StateKind, Context>;

namespace event {

struct SubscriptionChange {
  domain::ChannelSet channels;
  domain::ChannelSet groups;
};

struct Restore {
  domain::ChannelSet channels;
  domain::ChannelSet groups;
  domain::Cursor cursor;
};

struct HandshakeSuccess {
  domain::Cursor cursor;
};

struct HandshakeFailure {
  EndpointError error;
};

struct ReceiveSuccess {
  domain::Cursor cursor;
  std::vector<domain::Message> messages;
};

struct ReceiveFailure {
  EndpointError error;
};

struct Disconnect {};

struct Reconnect {
  std::optional<domain::Cursor> cursor;
};

// Retry wait elapsed.
struct Retry {};

}  // namespace event

// Alternative order must match EventKind.
using Event =
    std::variant<event::SubscriptionChange, event::Restore,
                 event::HandshakeSuccess, event::HandshakeFailure,
                 event::ReceiveSuccess, event::ReceiveFailure,
                 event::Disconnect, event::Reconnect, event::Retry>;

enum class EventKind {
  SubscriptionChange,
  Restore,
  HandshakeSuccess,
  HandshakeFailure,
  ReceiveSuccess,
  ReceiveFailure,
  Disconnect,
  Reconnect,
  Retry,
};

// Exclusivity keys: at most one effect runs per channel.
enum class EffectChannel {
  Handshake,
  Receive,
};

namespace effect {

struct Handshake {
  domain::ChannelSet channels;
  domain::ChannelSet groups;
};

// Handshake re-issued after a retry wait.
struct HandshakeReconnect {
  domain::ChannelSet channels;
  domain::ChannelSet groups;
  int attempts{0};
  std::optional<EndpointError> reason;
};

struct ReceiveMessages {
  domain::ChannelSet channels;
  domain::ChannelSet groups;
  domain::Cursor cursor;
};

// Receive re-issued after a retry wait.
struct ReceiveReconnect {
  domain::ChannelSet channels;
  domain::ChannelSet groups;
  domain::Cursor cursor;
  int attempts{0};
  std::optional<EndpointError> reason;
};

struct EmitMessages {
  std::vector<domain::Message> messages;
};

struct EmitStatus {
  domain::Status status;
};

struct Wait {
  EffectChannel channel{EffectChannel::Receive};
  std::chrono::milliseconds delay{0};
};

struct CancelPrevious {
  EffectChannel channel{EffectChannel::Receive};
};

}  // namespace effect

using Effect =
    std::variant<effect::Handshake, effect::HandshakeReconnect,
                 effect::ReceiveMessages, effect::ReceiveReconnect,
                 effect::EmitMessages, effect::EmitStatus, effect::Wait,
                 effect::CancelPrevious>;

// -----------------------------------------------------------------------------
// Machine: traits consumed by TransitionTable, EffectDispatcher and
// EventEngine
// -----------------------------------------------------------------------------
struct Machine {
  using StateKind = subscribe::StateKind;
  using Context = subscribe::Context;
  using State = subscribe::State;
  using Event = subscribe::Event;
  using EventKind = subscribe::EventKind;
  using Effect = subscribe::Effect;
  using EffectChannel = subscribe::EffectChannel;

  static EventKind kindOf(const Event& event) {
    return static_cast<EventKind>(event.index());
  }

  static std::optional<EffectChannel> channelOf(const Effect& effect);
  static std::optional<EffectChannel> cancelTargetOf(const Effect& effect);
};

const char* toString(StateKind kind);
const char* toString(EffectChannel channel);
const char* eventName(const Event& event);
const char* effectName(const Effect& effect);

}  // namespace subscribe
}  // namespace pulse
