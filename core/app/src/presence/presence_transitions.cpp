#include "pulse/presence/presence_transitions.hpp"

#include <utility>

namespace pulse {
namespace presence {

namespace {

using Table = event_engine::TransitionTable<Machine>;
using Result = Table::Result;
using Transition = event_engine::Transition<Machine>;
using Effects = std::vector<Effect>;

Transition to(StateKind kind, Context ctx, Effects effects = {}) {
  return Transition{State{kind, std::move(ctx)}, std::move(effects)};
}

Transition heartbeating(Context ctx, Effects effects = {}) {
  ctx.attempts = 0;
  ctx.reason.reset();
  effects.push_back(effect::Heartbeat{ctx.channels, ctx.groups});
  return to(StateKind::Heartbeating, std::move(ctx), std::move(effects));
}

// Appends Leave for `channels`/`groups` unless leave events are suppressed
// or nothing announceable remains once presence channels are dropped.
void appendLeave(Effects& effects, const TransitionOptions& options,
                 const domain::ChannelSet& channels,
                 const domain::ChannelSet& groups) {
  if (options.suppress_leave_events) {
    return;
  }
  auto announced = channels.withoutPresenceChannels();
  if (announced.empty() && groups.empty()) {
    return;
  }
  effects.push_back(effect::Leave{std::move(announced), groups});
}

domain::HeartbeatStatus heartbeatStatus(const Context& ctx,
                                        std::optional<EndpointError> error) {
  domain::HeartbeatStatus status;
  status.success = !error.has_value();
  status.channels = ctx.channels;
  status.groups = ctx.groups;
  status.error = std::move(error);
  return status;
}

}  // namespace

event_engine::TransitionTable<Machine> makeTransitions(
    TransitionOptions options, std::shared_ptr<RetryPolicy> retry_policy) {
  Table table;

  // ---------------------------------------------------------------------------
  // Joined
  // ---------------------------------------------------------------------------
  table.on(StateKind::HeartbeatInactive, EventKind::Joined,
           [](const State& from, const Event& e) -> Result {
             const auto& joined = std::get<event::Joined>(e);
             if (joined.channels.empty() && joined.groups.empty()) {
               return std::nullopt;
             }
             Context next;
             next.channels = from.context.channels.unionWith(joined.channels);
             next.groups = from.context.groups.unionWith(joined.groups);
             return heartbeating(std::move(next));
           });

  table.on({StateKind::Heartbeating, StateKind::HeartbeatCooldown,
            StateKind::HeartbeatFailed},
           EventKind::Joined, [](const State& from, const Event& e) -> Result {
             const auto& joined = std::get<event::Joined>(e);
             Context next = from.context;
             next.channels = next.channels.unionWith(joined.channels);
             next.groups = next.groups.unionWith(joined.groups);
             return heartbeating(std::move(next));
           });

  table.on(StateKind::HeartbeatStopped, EventKind::Joined,
           [](const State& from, const Event& e) -> Result {
             const auto& joined = std::get<event::Joined>(e);
             Context next = from.context;
             next.channels = next.channels.unionWith(joined.channels);
             next.groups = next.groups.unionWith(joined.groups);
             return to(StateKind::HeartbeatStopped, std::move(next));
           });

  // ---------------------------------------------------------------------------
  // Left
  // ---------------------------------------------------------------------------
  table.on({StateKind::Heartbeating, StateKind::HeartbeatCooldown,
            StateKind::HeartbeatFailed},
           EventKind::Left,
           [options](const State& from, const Event& e) -> Result {
             const auto& left = std::get<event::Left>(e);
             const Context& ctx = from.context;

             Effects effects;
             appendLeave(effects, options,
                         ctx.channels.intersection(left.channels),
                         ctx.groups.intersection(left.groups));

             Context next = ctx;
             next.channels = ctx.channels.difference(left.channels);
             next.groups = ctx.groups.difference(left.groups);

             if (next.channels.empty() && next.groups.empty()) {
               effects.push_back(
                   effect::CancelPrevious{EffectChannel::Heartbeat});
               return to(StateKind::HeartbeatInactive, Context{},
                         std::move(effects));
             }
             return heartbeating(std::move(next), std::move(effects));
           });

  table.on(StateKind::HeartbeatStopped, EventKind::Left,
           [](const State& from, const Event& e) -> Result {
             const auto& left = std::get<event::Left>(e);
             Context next = from.context;
             next.channels = next.channels.difference(left.channels);
             next.groups = next.groups.difference(left.groups);
             return to(StateKind::HeartbeatStopped, std::move(next));
           });

  // ---------------------------------------------------------------------------
  // LeftAll
  // ---------------------------------------------------------------------------
  table.on({StateKind::Heartbeating, StateKind::HeartbeatCooldown,
            StateKind::HeartbeatFailed, StateKind::HeartbeatStopped},
           EventKind::LeftAll,
           [options](const State& from, const Event& e) -> Result {
             const auto& left_all = std::get<event::LeftAll>(e);

             Effects effects{effect::CancelPrevious{EffectChannel::Heartbeat}};
             if (!left_all.is_offline &&
                 from.kind != StateKind::HeartbeatStopped) {
               appendLeave(effects, options, from.context.channels,
                           from.context.groups);
             }
             return to(StateKind::HeartbeatInactive, Context{},
                       std::move(effects));
           });

  // ---------------------------------------------------------------------------
  // Heartbeat outcomes and timers
  // ---------------------------------------------------------------------------
  table.on(StateKind::Heartbeating, EventKind::HeartbeatSuccess,
           [options](const State& from, const Event&) -> Result {
             Context next = from.context;
             next.attempts = 0;
             next.reason.reset();

             Effects effects;
             if (options.announce_successful_heartbeats) {
               effects.push_back(effect::EmitHeartbeatStatus{
                   heartbeatStatus(next, std::nullopt)});
             }
             effects.push_back(effect::Wait{EffectChannel::Heartbeat,
                                            options.heartbeat_interval,
                                            WaitReason::Cooldown});
             return to(StateKind::HeartbeatCooldown, std::move(next),
                       std::move(effects));
           });

  table.on(StateKind::Heartbeating, EventKind::HeartbeatFailure,
           [options, retry_policy](const State& from,
                                   const Event& e) -> Result {
             const auto& failure = std::get<event::HeartbeatFailure>(e);
             if (failure.error.isCancellation()) {
               return std::nullopt;
             }

             Context next = from.context;
             next.reason = failure.error;

             const auto decision = retry_policy->shouldRetry(
                 from.context.attempts, EndpointKind::Heartbeat,
                 failure.error);
             if (decision.retry) {
               next.attempts += 1;
               return to(StateKind::Heartbeating, std::move(next),
                         {effect::Wait{EffectChannel::Heartbeat,
                                       decision.delay, WaitReason::Retry}});
             }

             Effects effects;
             if (options.announce_failed_heartbeats) {
               effects.push_back(effect::EmitHeartbeatStatus{
                   heartbeatStatus(next, failure.error)});
             }
             return to(StateKind::HeartbeatFailed, std::move(next),
                       std::move(effects));
           });

  table.on(StateKind::Heartbeating, EventKind::Retry,
           [](const State& from, const Event&) -> Result {
             if (from.context.attempts == 0) {
               return std::nullopt;
             }
             const Context& ctx = from.context;
             return to(StateKind::Heartbeating, ctx,
                       {effect::Heartbeat{ctx.channels, ctx.groups}});
           });

  table.on(StateKind::HeartbeatCooldown, EventKind::TimesUp,
           [](const State& from, const Event&) -> Result {
             return heartbeating(from.context);
           });

  // ---------------------------------------------------------------------------
  // Disconnect / Reconnect
  // ---------------------------------------------------------------------------
  table.on({StateKind::Heartbeating, StateKind::HeartbeatCooldown},
           EventKind::Disconnect,
           [options](const State& from, const Event& e) -> Result {
             const auto& disconnect = std::get<event::Disconnect>(e);
             Effects effects{effect::CancelPrevious{EffectChannel::Heartbeat}};
             if (!disconnect.is_offline) {
               appendLeave(effects, options, from.context.channels,
                           from.context.groups);
             }
             return to(StateKind::HeartbeatStopped, from.context,
                       std::move(effects));
           });

  table.on(StateKind::HeartbeatFailed, EventKind::Disconnect,
           [options](const State& from, const Event& e) -> Result {
             const auto& disconnect = std::get<event::Disconnect>(e);
             Effects effects;
             if (!disconnect.is_offline) {
               appendLeave(effects, options, from.context.channels,
                           from.context.groups);
             }
             return to(StateKind::HeartbeatStopped, from.context,
                       std::move(effects));
           });

  table.on({StateKind::HeartbeatFailed, StateKind::HeartbeatStopped},
           EventKind::Reconnect,
           [](const State& from, const Event&) -> Result {
             if (from.context.channels.empty() && from.context.groups.empty()) {
               return to(StateKind::HeartbeatInactive, Context{});
             }
             return heartbeating(from.context);
           });

  return table;
}

}  // namespace presence
}  // namespace pulse
