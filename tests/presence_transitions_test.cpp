// =============================================================================
// presence_transitions_test.cpp
// =============================================================================
// Table-level tests for the presence state machine built by
// pulse::presence::makeTransitions().
//
// Validates:
//   - Join -> heartbeat -> cooldown -> times up -> heartbeat cycle
//   - Partial and total leave, with and without leave announcements
//   - Offline leave-all and disconnect send no leave request
//   - Heartbeat failures retry, then fail with an optional status
//   - Reconnect resumes heartbeating or returns to inactive
//   - Membership changes while stopped are recorded without network effects
//   - Retry needs a failure streak; unregistered pairs are no-ops
// =============================================================================

#include "pulse/presence/presence_transitions.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <vector>

using namespace std::chrono_literals;
using pulse::domain::ChannelSet;
using pulse::EndpointError;

namespace pres = pulse::presence;
namespace fx = pulse::presence::effect;
namespace ev = pulse::presence::event;

class PresenceTransitionsTest : public ::testing::Test {
 protected:
  using Table = pulse::event_engine::TransitionTable<pres::Machine>;
  using Transition = pulse::event_engine::Transition<pres::Machine>;

  static Table makeTable(pres::TransitionOptions options = defaults()) {
    auto retry = pulse::RetryConfiguration::linear(2s, 2);
    retry.maximum_jitter = 0ms;
    return pres::makeTransitions(options,
                                 std::make_shared<pulse::RetryPolicy>(retry));
  }

  static pres::TransitionOptions defaults() {
    pres::TransitionOptions options;
    options.heartbeat_interval = 59000ms;
    return options;
  }

  Table table = makeTable();

  Transition step(const pres::State& state, const pres::Event& event) const {
    return step(table, state, event);
  }

  static Transition step(const Table& t, const pres::State& state,
                         const pres::Event& event) {
    auto result = t.apply(state, event);
    EXPECT_TRUE(result.has_value()) << "transition declined";
    return result ? *result : Transition{state, {}};
  }

  static pres::State inactive() {
    return pres::State{pres::StateKind::HeartbeatInactive, pres::Context{}};
  }

  static pres::State state(pres::StateKind kind, ChannelSet channels,
                           ChannelSet groups = {}) {
    pres::Context ctx;
    ctx.channels = std::move(channels);
    ctx.groups = std::move(groups);
    return pres::State{kind, ctx};
  }

  template <typename T>
  static std::vector<T> all(const std::vector<pres::Effect>& effects) {
    std::vector<T> out;
    for (const auto& effect : effects) {
      if (const auto* e = std::get_if<T>(&effect)) {
        out.push_back(*e);
      }
    }
    return out;
  }
};

// -----------------------------------------------------------------------------
// 1. The full keep-alive cycle.
// Why: A missed TimesUp edge would let the user silently time out of every
//      channel after one presence timeout.
// -----------------------------------------------------------------------------
TEST_F(PresenceTransitionsTest, HeartbeatCooldownCycle) {
  auto t = step(inactive(), ev::Joined{{"a"}, {}});
  EXPECT_EQ(t.next.kind, pres::StateKind::Heartbeating);
  ASSERT_EQ(all<fx::Heartbeat>(t.effects).size(), 1u);
  EXPECT_EQ(all<fx::Heartbeat>(t.effects)[0].channels, (ChannelSet{"a"}));

  t = step(t.next, ev::HeartbeatSuccess{});
  EXPECT_EQ(t.next.kind, pres::StateKind::HeartbeatCooldown);
  const auto waits = all<fx::Wait>(t.effects);
  ASSERT_EQ(waits.size(), 1u);
  EXPECT_EQ(waits[0].delay, 59000ms);
  EXPECT_EQ(waits[0].reason, pres::WaitReason::Cooldown);
  EXPECT_TRUE(all<fx::EmitHeartbeatStatus>(t.effects).empty());

  t = step(t.next, ev::TimesUp{});
  EXPECT_EQ(t.next.kind, pres::StateKind::Heartbeating);
  EXPECT_EQ(all<fx::Heartbeat>(t.effects).size(), 1u);
}

// -----------------------------------------------------------------------------
// 2. Joining with nothing is declined in HeartbeatInactive.
// -----------------------------------------------------------------------------
TEST_F(PresenceTransitionsTest, EmptyJoinIgnored) {
  EXPECT_FALSE(table.apply(inactive(), ev::Joined{{}, {}}).has_value());
}

// -----------------------------------------------------------------------------
// 3. Joining more channels during cooldown heartbeats the union at once.
// -----------------------------------------------------------------------------
TEST_F(PresenceTransitionsTest, JoinDuringCooldownHeartbeatsUnion) {
  const auto t = step(state(pres::StateKind::HeartbeatCooldown, {"a"}),
                      ev::Joined{{"b"}, {"g"}});

  EXPECT_EQ(t.next.kind, pres::StateKind::Heartbeating);
  const auto beats = all<fx::Heartbeat>(t.effects);
  ASSERT_EQ(beats.size(), 1u);
  EXPECT_EQ(beats[0].channels, (ChannelSet{"a", "b"}));
  EXPECT_EQ(beats[0].groups, (ChannelSet{"g"}));
}

// -----------------------------------------------------------------------------
// 4. Leaving some channels announces only those and keeps heartbeating.
// -----------------------------------------------------------------------------
TEST_F(PresenceTransitionsTest, PartialLeave) {
  const auto t = step(state(pres::StateKind::HeartbeatCooldown, {"a", "b"}),
                      ev::Left{{"b", "zzz"}, {}});

  EXPECT_EQ(t.next.kind, pres::StateKind::Heartbeating);
  EXPECT_EQ(t.next.context.channels, (ChannelSet{"a"}));

  const auto leaves = all<fx::Leave>(t.effects);
  ASSERT_EQ(leaves.size(), 1u);
  EXPECT_EQ(leaves[0].channels, (ChannelSet{"b"}));
  ASSERT_EQ(all<fx::Heartbeat>(t.effects).size(), 1u);
}

// -----------------------------------------------------------------------------
// 5. Leaving the last channel goes inactive and stops the heartbeat.
// -----------------------------------------------------------------------------
TEST_F(PresenceTransitionsTest, LeavingLastChannelGoesInactive) {
  const auto t = step(state(pres::StateKind::Heartbeating, {"a"}),
                      ev::Left{{"a"}, {}});

  EXPECT_EQ(t.next.kind, pres::StateKind::HeartbeatInactive);
  EXPECT_EQ(all<fx::Leave>(t.effects).size(), 1u);
  EXPECT_EQ(all<fx::CancelPrevious>(t.effects).size(), 1u);
  EXPECT_TRUE(all<fx::Heartbeat>(t.effects).empty());
}

// -----------------------------------------------------------------------------
// 6. suppress_leave_events removes every Leave effect.
// -----------------------------------------------------------------------------
TEST_F(PresenceTransitionsTest, SuppressedLeaveEvents) {
  auto options = defaults();
  options.suppress_leave_events = true;
  const auto quiet = makeTable(options);

  const auto left = step(quiet, state(pres::StateKind::Heartbeating, {"a"}),
                         ev::Left{{"a"}, {}});
  EXPECT_TRUE(all<fx::Leave>(left.effects).empty());

  const auto left_all = step(quiet,
                             state(pres::StateKind::Heartbeating, {"a"}),
                             ev::LeftAll{false});
  EXPECT_TRUE(all<fx::Leave>(left_all.effects).empty());
}

// -----------------------------------------------------------------------------
// 7. Leave-all online announces everything; offline announces nothing.
// Why: Without a network the leave request would only fail after its
//      timeout and hold up shutdown.
// -----------------------------------------------------------------------------
TEST_F(PresenceTransitionsTest, LeftAllOnlineVersusOffline) {
  const auto subscribed =
      state(pres::StateKind::HeartbeatCooldown, {"a", "b"}, {"g"});

  const auto online = step(subscribed, ev::LeftAll{false});
  EXPECT_EQ(online.next.kind, pres::StateKind::HeartbeatInactive);
  EXPECT_TRUE(online.next.context.channels.empty());
  const auto leaves = all<fx::Leave>(online.effects);
  ASSERT_EQ(leaves.size(), 1u);
  EXPECT_EQ(leaves[0].channels, (ChannelSet{"a", "b"}));
  EXPECT_EQ(leaves[0].groups, (ChannelSet{"g"}));

  const auto offline = step(subscribed, ev::LeftAll{true});
  EXPECT_EQ(offline.next.kind, pres::StateKind::HeartbeatInactive);
  EXPECT_TRUE(all<fx::Leave>(offline.effects).empty());
  EXPECT_EQ(all<fx::CancelPrevious>(offline.effects).size(), 1u);
}

// -----------------------------------------------------------------------------
// 8. Presence channels never appear in a Leave.
// -----------------------------------------------------------------------------
TEST_F(PresenceTransitionsTest, LeaveSkipsPresenceChannels) {
  const auto only_presence =
      step(state(pres::StateKind::Heartbeating, {"a-pnpres"}),
           ev::LeftAll{false});
  EXPECT_TRUE(all<fx::Leave>(only_presence.effects).empty());

  const auto mixed = step(state(pres::StateKind::Heartbeating,
                                {"a", "a-pnpres"}),
                          ev::LeftAll{false});
  const auto leaves = all<fx::Leave>(mixed.effects);
  ASSERT_EQ(leaves.size(), 1u);
  EXPECT_EQ(leaves[0].channels, (ChannelSet{"a"}));
}

// -----------------------------------------------------------------------------
// 9. Failures retry on a timer, then fail with an announced status.
// -----------------------------------------------------------------------------
TEST_F(PresenceTransitionsTest, HeartbeatFailureRetriesThenFails) {
  const auto error = EndpointError::transport("reset");
  auto t = step(state(pres::StateKind::Heartbeating, {"a"}),
                ev::HeartbeatFailure{error});

  EXPECT_EQ(t.next.kind, pres::StateKind::Heartbeating);
  EXPECT_EQ(t.next.context.attempts, 1);
  const auto waits = all<fx::Wait>(t.effects);
  ASSERT_EQ(waits.size(), 1u);
  EXPECT_EQ(waits[0].reason, pres::WaitReason::Retry);
  EXPECT_EQ(waits[0].delay, 2000ms);

  t = step(t.next, ev::Retry{});
  EXPECT_EQ(all<fx::Heartbeat>(t.effects).size(), 1u);

  t = step(t.next, ev::HeartbeatFailure{error});
  t = step(t.next, ev::Retry{});
  t = step(t.next, ev::HeartbeatFailure{error});

  EXPECT_EQ(t.next.kind, pres::StateKind::HeartbeatFailed);
  const auto reported = all<fx::EmitHeartbeatStatus>(t.effects);
  ASSERT_EQ(reported.size(), 1u);
  EXPECT_FALSE(reported[0].status.success);
  ASSERT_TRUE(reported[0].status.error.has_value());
  EXPECT_EQ(reported[0].status.error->message, "reset");
}

// -----------------------------------------------------------------------------
// 10. Announcement flags control heartbeat statuses.
// -----------------------------------------------------------------------------
TEST_F(PresenceTransitionsTest, AnnouncementFlags) {
  auto options = defaults();
  options.announce_successful_heartbeats = true;
  options.announce_failed_heartbeats = false;
  const auto custom = makeTable(options);

  const auto ok = step(custom, state(pres::StateKind::Heartbeating, {"a"}),
                       ev::HeartbeatSuccess{});
  const auto statuses = all<fx::EmitHeartbeatStatus>(ok.effects);
  ASSERT_EQ(statuses.size(), 1u);
  EXPECT_TRUE(statuses[0].status.success);

  const auto failed =
      step(custom, state(pres::StateKind::Heartbeating, {"a"}),
           ev::HeartbeatFailure{EndpointError::server(403, "denied")});
  EXPECT_EQ(failed.next.kind, pres::StateKind::HeartbeatFailed);
  EXPECT_TRUE(all<fx::EmitHeartbeatStatus>(failed.effects).empty());
}

// -----------------------------------------------------------------------------
// 11. Disconnect stops heartbeating and leaves unless offline; Reconnect
//     resumes.
// -----------------------------------------------------------------------------
TEST_F(PresenceTransitionsTest, DisconnectAndReconnect) {
  const auto cooling = state(pres::StateKind::HeartbeatCooldown, {"a"});

  const auto online = step(cooling, ev::Disconnect{false});
  EXPECT_EQ(online.next.kind, pres::StateKind::HeartbeatStopped);
  EXPECT_EQ(all<fx::Leave>(online.effects).size(), 1u);
  EXPECT_EQ(all<fx::CancelPrevious>(online.effects).size(), 1u);

  const auto offline = step(cooling, ev::Disconnect{true});
  EXPECT_TRUE(all<fx::Leave>(offline.effects).empty());

  const auto resumed = step(online.next, ev::Reconnect{});
  EXPECT_EQ(resumed.next.kind, pres::StateKind::Heartbeating);
  EXPECT_EQ(all<fx::Heartbeat>(resumed.effects).size(), 1u);
}

// -----------------------------------------------------------------------------
// 12. While stopped, joins and leaves update membership silently; a
//     reconnect with nothing left goes inactive.
// -----------------------------------------------------------------------------
TEST_F(PresenceTransitionsTest, StoppedMembershipChanges) {
  auto t = step(state(pres::StateKind::HeartbeatStopped, {"a"}),
                ev::Joined{{"b"}, {}});
  EXPECT_EQ(t.next.kind, pres::StateKind::HeartbeatStopped);
  EXPECT_EQ(t.next.context.channels, (ChannelSet{"a", "b"}));
  EXPECT_TRUE(t.effects.empty());

  t = step(t.next, ev::Left{{"a", "b"}, {}});
  EXPECT_TRUE(t.effects.empty());
  EXPECT_TRUE(t.next.context.channels.empty());

  t = step(t.next, ev::Reconnect{});
  EXPECT_EQ(t.next.kind, pres::StateKind::HeartbeatInactive);
  EXPECT_TRUE(t.effects.empty());
}

// -----------------------------------------------------------------------------
// 13. Leave-all from stopped sends nothing; the leave already went out on
//     disconnect.
// -----------------------------------------------------------------------------
TEST_F(PresenceTransitionsTest, LeftAllFromStoppedSendsNoLeave) {
  const auto t = step(state(pres::StateKind::HeartbeatStopped, {"a"}),
                      ev::LeftAll{false});
  EXPECT_EQ(t.next.kind, pres::StateKind::HeartbeatInactive);
  EXPECT_TRUE(all<fx::Leave>(t.effects).empty());
}

// -----------------------------------------------------------------------------
// 14. Undefined pairs are no-ops.
// -----------------------------------------------------------------------------
TEST_F(PresenceTransitionsTest, UndefinedPairsAreNoOps) {
  EXPECT_FALSE(table.apply(inactive(), ev::Left{{"a"}, {}}).has_value());
  EXPECT_FALSE(table.apply(inactive(), ev::LeftAll{false}).has_value());
  EXPECT_FALSE(table.apply(inactive(), ev::HeartbeatSuccess{}).has_value());
  EXPECT_FALSE(
      table.apply(state(pres::StateKind::Heartbeating, {"a"}), ev::TimesUp{})
          .has_value());
  EXPECT_FALSE(
      table.apply(state(pres::StateKind::HeartbeatCooldown, {"a"}),
                  ev::Reconnect{})
          .has_value());
}

// -----------------------------------------------------------------------------
// 15. Every (state, event) pair without a handler is a no-op.
// -----------------------------------------------------------------------------
TEST_F(PresenceTransitionsTest, EveryUnregisteredPairIsNoOp) {
  const std::vector<pres::Event> samples{
      ev::Joined{{"b"}, {}},
      ev::Left{{"a"}, {}},
      ev::LeftAll{false},
      ev::Disconnect{false},
      ev::Reconnect{},
      ev::HeartbeatSuccess{},
      ev::HeartbeatFailure{EndpointError::transport("reset")},
      ev::TimesUp{},
      ev::Retry{},
  };
  const std::vector<pres::StateKind> kinds{
      pres::StateKind::HeartbeatInactive, pres::StateKind::Heartbeating,
      pres::StateKind::HeartbeatCooldown, pres::StateKind::HeartbeatFailed,
      pres::StateKind::HeartbeatStopped,
  };

  std::size_t undefined = 0;
  for (const auto kind : kinds) {
    auto current = state(kind, {"a"});
    current.context.attempts = 1;
    for (const auto& event : samples) {
      if (table.contains(kind, pres::Machine::kindOf(event))) {
        continue;
      }
      ++undefined;
      EXPECT_FALSE(table.apply(current, event).has_value())
          << pres::toString(kind) << " + " << pres::eventName(event);
    }
  }
  EXPECT_GT(undefined, 0u);
}

// -----------------------------------------------------------------------------
// 16. A Retry with no failure streak behind it is ignored.
// Why: A retry timer that fired just as a heartbeat succeeded elsewhere must
//      not start a second heartbeat.
// -----------------------------------------------------------------------------
TEST_F(PresenceTransitionsTest, RetryWithoutFailureStreakIgnored) {
  const auto idle_retry =
      table.apply(state(pres::StateKind::Heartbeating, {"a"}), ev::Retry{});
  EXPECT_FALSE(idle_retry.has_value());

  auto retrying = state(pres::StateKind::Heartbeating, {"a"});
  retrying.context.attempts = 1;
  const auto t = step(retrying, ev::Retry{});
  EXPECT_EQ(all<fx::Heartbeat>(t.effects).size(), 1u);
  EXPECT_EQ(t.next.context.attempts, 1);
}
