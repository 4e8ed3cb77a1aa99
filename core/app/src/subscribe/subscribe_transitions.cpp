#include "pulse/subscribe/subscribe_transitions.hpp"

#include <iostream>
#include <utility>

namespace pulse {
namespace subscribe {

namespace {

using Table = event_engine::TransitionTable<Machine>;
using Result = Table::Result;
using Transition = event_engine::Transition<Machine>;
using Effects = std::vector<Effect>;

constexpr StateKind kAllStates[] = {
    StateKind::Unsubscribed,   StateKind::Handshaking,
    StateKind::HandshakeFailed, StateKind::HandshakeStopped,
    StateKind::Receiving,      StateKind::ReceiveFailed,
    StateKind::ReceiveStopped,
};

domain::Status makeStatus(domain::StatusCategory category, const Context& ctx) {
  domain::Status status;
  status.category = category;
  status.channels = ctx.channels;
  status.groups = ctx.groups;
  status.cursor = ctx.cursor;
  return status;
}

domain::Status makeErrorStatus(domain::StatusCategory category,
                               const Context& ctx, const EndpointError& error) {
  domain::Status status = makeStatus(category, ctx);
  status.error = error;
  return status;
}

// -----------------------------------------------------------------------------
// Empty channel/group set: everything stops, cursor is forgotten.
// -----------------------------------------------------------------------------
Transition toUnsubscribed(const State& from) {
  Effects effects{effect::CancelPrevious{EffectChannel::Handshake},
                  effect::CancelPrevious{EffectChannel::Receive}};
  if (from.kind == StateKind::Receiving) {
    effects.push_back(effect::EmitStatus{
        makeStatus(domain::StatusCategory::Disconnected, from.context)});
  }
  return Transition{State{StateKind::Unsubscribed, Context{}},
                    std::move(effects)};
}

Transition toHandshaking(const State& from, Context next,
                         bool announce_change) {
  Effects effects{effect::CancelPrevious{EffectChannel::Receive}};
  if (announce_change && from.kind == StateKind::Receiving) {
    effects.push_back(effect::EmitStatus{
        makeStatus(domain::StatusCategory::SubscriptionChanged, next)});
  }
  effects.push_back(effect::Handshake{next.channels, next.groups});
  return Transition{State{StateKind::Handshaking, std::move(next)},
                    std::move(effects)};
}

Transition handshakeFrom(Context ctx,
                         const std::optional<domain::Cursor>& cursor) {
  if (cursor) {
    ctx.cursor = cursor;
  }
  ctx.attempts = 0;
  ctx.reason.reset();
  Effects effects{effect::Handshake{ctx.channels, ctx.groups}};
  return Transition{State{StateKind::Handshaking, std::move(ctx)},
                    std::move(effects)};
}

Transition receiveFrom(Context ctx,
                       const std::optional<domain::Cursor>& cursor) {
  if (cursor) {
    ctx.cursor = cursor;
  }
  ctx.attempts = 0;
  ctx.reason.reset();
  Effects effects{effect::ReceiveMessages{
      ctx.channels, ctx.groups, ctx.cursor.value_or(domain::Cursor{})}};
  return Transition{State{StateKind::Receiving, std::move(ctx)},
                    std::move(effects)};
}

Transition stay(StateKind kind, Context ctx, Effects effects = {}) {
  return Transition{State{kind, std::move(ctx)}, std::move(effects)};
}

}  // namespace

event_engine::TransitionTable<Machine> makeTransitions(
    TransitionOptions options, std::shared_ptr<RetryPolicy> retry_policy) {
  Table table;

  // ---------------------------------------------------------------------------
  // Any state: SubscriptionChange / Restore
  // ---------------------------------------------------------------------------
  for (StateKind kind : kAllStates) {
    table.on(kind, EventKind::SubscriptionChange,
             [options](const State& from, const Event& e) -> Result {
               const auto& change = std::get<event::SubscriptionChange>(e);
               if (change.channels.empty() && change.groups.empty()) {
                 return toUnsubscribed(from);
               }

               Context next;
               next.channels = change.channels;
               next.groups = change.groups;
               if (options.cursor_policy == CursorPolicy::Preserve) {
                 next.cursor = from.context.cursor;
               }
               return toHandshaking(from, std::move(next), true);
             });

    table.on(kind, EventKind::Restore,
             [](const State& from, const Event& e) -> Result {
               const auto& restore = std::get<event::Restore>(e);
               if (restore.channels.empty() && restore.groups.empty()) {
                 return toUnsubscribed(from);
               }

               Context next;
               next.channels = restore.channels;
               next.groups = restore.groups;
               next.cursor = restore.cursor;
               return toHandshaking(from, std::move(next), false);
             });
  }

  // ---------------------------------------------------------------------------
  // Handshaking
  // ---------------------------------------------------------------------------
  table.on(StateKind::Handshaking, EventKind::HandshakeSuccess,
           [](const State& from, const Event& e) -> Result {
             const auto& success = std::get<event::HandshakeSuccess>(e);

             Context next = from.context;
             // A carried cursor wins over the server's "now"; only the
             // region comes from the handshake.
             if (next.cursor && !next.cursor->isInitial()) {
               next.cursor->region = success.cursor.region;
             } else {
               next.cursor = success.cursor;
             }
             next.attempts = 0;
             next.reason.reset();

             Effects effects{
                 effect::EmitStatus{
                     makeStatus(domain::StatusCategory::Connected, next)},
                 effect::ReceiveMessages{next.channels, next.groups,
                                         *next.cursor}};
             return stay(StateKind::Receiving, std::move(next),
                         std::move(effects));
           });

  table.on(StateKind::Handshaking, EventKind::HandshakeFailure,
           [retry_policy](const State& from, const Event& e) -> Result {
             const auto& failure = std::get<event::HandshakeFailure>(e);
             if (failure.error.isCancellation()) {
               return std::nullopt;
             }

             Context next = from.context;
             next.reason = failure.error;

             const auto decision = retry_policy->shouldRetry(
                 from.context.attempts, EndpointKind::Subscribe,
                 failure.error);
             if (decision.retry) {
               next.attempts += 1;
               return stay(StateKind::Handshaking, std::move(next),
                           {effect::Wait{EffectChannel::Handshake,
                                         decision.delay}});
             }

             Effects effects{effect::EmitStatus{makeErrorStatus(
                 domain::StatusCategory::ConnectionError, next,
                 failure.error)}};
             return stay(StateKind::HandshakeFailed, std::move(next),
                         std::move(effects));
           });

  table.on(StateKind::Handshaking, EventKind::Retry,
           [](const State& from, const Event&) -> Result {
             if (from.context.attempts == 0) {
               return std::nullopt;
             }
             const Context& ctx = from.context;
             return stay(StateKind::Handshaking, ctx,
                         {effect::HandshakeReconnect{ctx.channels, ctx.groups,
                                                     ctx.attempts,
                                                     ctx.reason}});
           });

  table.on(StateKind::Handshaking, EventKind::Disconnect,
           [](const State& from, const Event&) -> Result {
             return stay(StateKind::HandshakeStopped, from.context,
                         {effect::CancelPrevious{EffectChannel::Handshake}});
           });

  // ---------------------------------------------------------------------------
  // Receiving
  // ---------------------------------------------------------------------------
  table.on(StateKind::Receiving, EventKind::ReceiveSuccess,
           [](const State& from, const Event& e) -> Result {
             const auto& success = std::get<event::ReceiveSuccess>(e);

             Context next = from.context;
             if (next.cursor &&
                 domain::isBehind(success.cursor, *next.cursor)) {
               std::cerr << "[SubscribeEngine] server cursor "
                         << domain::toString(success.cursor)
                         << " is behind current "
                         << domain::toString(*next.cursor) << "; keeping "
                         << "current cursor\n";
             } else {
               next.cursor = success.cursor;
             }

             Effects effects;
             if (from.context.attempts > 0) {
               effects.push_back(effect::EmitStatus{
                   makeStatus(domain::StatusCategory::Reconnected, next)});
             }
             next.attempts = 0;
             next.reason.reset();

             effects.push_back(effect::EmitMessages{success.messages});
             effects.push_back(effect::ReceiveMessages{
                 next.channels, next.groups, *next.cursor});
             return stay(StateKind::Receiving, std::move(next),
                         std::move(effects));
           });

  table.on(StateKind::Receiving, EventKind::ReceiveFailure,
           [retry_policy](const State& from, const Event& e) -> Result {
             const auto& failure = std::get<event::ReceiveFailure>(e);
             if (failure.error.isCancellation()) {
               return std::nullopt;
             }

             Context next = from.context;
             next.reason = failure.error;

             const auto decision = retry_policy->shouldRetry(
                 from.context.attempts, EndpointKind::Subscribe,
                 failure.error);
             if (decision.retry) {
               Effects effects;
               if (from.context.attempts == 0) {
                 effects.push_back(effect::EmitStatus{makeErrorStatus(
                     domain::StatusCategory::Reconnecting, next,
                     failure.error)});
               }
               effects.push_back(
                   effect::Wait{EffectChannel::Receive, decision.delay});
               next.attempts += 1;
               return stay(StateKind::Receiving, std::move(next),
                           std::move(effects));
             }

             Effects effects{effect::EmitStatus{makeErrorStatus(
                 domain::StatusCategory::DisconnectedUnexpectedly, next,
                 failure.error)}};
             return stay(StateKind::ReceiveFailed, std::move(next),
                         std::move(effects));
           });

  table.on(StateKind::Receiving, EventKind::Retry,
           [](const State& from, const Event&) -> Result {
             if (from.context.attempts == 0) {
               return std::nullopt;
             }
             const Context& ctx = from.context;
             return stay(StateKind::Receiving, ctx,
                         {effect::ReceiveReconnect{
                             ctx.channels, ctx.groups,
                             ctx.cursor.value_or(domain::Cursor{}),
                             ctx.attempts, ctx.reason}});
           });

  table.on(StateKind::Receiving, EventKind::Disconnect,
           [](const State& from, const Event&) -> Result {
             return stay(StateKind::ReceiveStopped, from.context,
                         {effect::CancelPrevious{EffectChannel::Receive},
                          effect::EmitStatus{makeStatus(
                              domain::StatusCategory::Disconnected,
                              from.context)}});
           });

  // ---------------------------------------------------------------------------
  // Failed / stopped states
  // ---------------------------------------------------------------------------
  table.on({StateKind::HandshakeFailed, StateKind::HandshakeStopped},
           EventKind::Reconnect,
           [](const State& from, const Event& e) -> Result {
             return handshakeFrom(from.context,
                                  std::get<event::Reconnect>(e).cursor);
           });

  table.on(StateKind::HandshakeFailed, EventKind::Disconnect,
           [](const State& from, const Event&) -> Result {
             return stay(StateKind::HandshakeStopped, from.context);
           });

  table.on({StateKind::ReceiveFailed, StateKind::ReceiveStopped},
           EventKind::Reconnect,
           [](const State& from, const Event& e) -> Result {
             return receiveFrom(from.context,
                                std::get<event::Reconnect>(e).cursor);
           });

  table.on(StateKind::ReceiveFailed, EventKind::Disconnect,
           [](const State& from, const Event&) -> Result {
             return stay(StateKind::ReceiveStopped, from.context);
           });

  return table;
}

}  // namespace subscribe
}  // namespace pulse
