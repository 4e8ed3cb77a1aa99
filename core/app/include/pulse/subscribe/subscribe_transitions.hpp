#pragma once

#include "pulse/config/configuration.hpp"
#include "pulse/event_engine/transition_table.hpp"
#include "pulse/retry/retry_policy.hpp"
#include "pulse/subscribe/subscribe_machine.hpp"

#include <memory>

namespace pulse {
namespace subscribe {

struct TransitionOptions {
  CursorPolicy cursor_policy{CursorPolicy::Preserve};
};

// -----------------------------------------------------------------------------
// makeTransitions(options, retry_policy)
// -----------------------------------------------------------------------------
//
// @brief  Builds the complete subscription transition table.
//
// @details
// Handlers are pure apart from the retry policy's jitter source and a
// warning on std::cerr when the server hands back a cursor behind the
// current one (the current cursor is kept).
//
// `retry_policy` is shared with nothing else; it is consulted on the lane
// only. Must not be null.
// -----------------------------------------------------------------------------
event_engine::TransitionTable<Machine> makeTransitions(
    TransitionOptions options, std::shared_ptr<RetryPolicy> retry_policy);

}  // namespace subscribe
}  // namespace pulse
