#pragma once

#include "pulse/event_engine/transition_table.hpp"
#include "pulse/presence/presence_machine.hpp"
#include "pulse/retry/retry_policy.hpp"

#include <chrono>
#include <memory>

namespace pulse {
namespace presence {

struct TransitionOptions {
  std::chrono::milliseconds heartbeat_interval{0};
  bool suppress_leave_events{false};
  bool announce_successful_heartbeats{false};
  bool announce_failed_heartbeats{true};
};

// Builds the complete presence transition table. `retry_policy` must not be
// null; it is consulted on the lane only.
event_engine::TransitionTable<Machine> makeTransitions(
    TransitionOptions options, std::shared_ptr<RetryPolicy> retry_policy);

}  // namespace presence
}  // namespace pulse
