#pragma once

#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace pulse {
namespace event_engine {

// -----------------------------------------------------------------------------
// EngineState: immutable {kind, context} pair
// -----------------------------------------------------------------------------
// Each transition builds a new value; the engine publishes it behind a
// shared_ptr<const EngineState> so readers on other threads see a complete
// snapshot.
// -----------------------------------------------------------------------------
template <typename Kind, typename Context>
struct EngineState {
  Kind kind;
  Context context;
};

// -----------------------------------------------------------------------------
// Transition: result of one table lookup
// -----------------------------------------------------------------------------
// `effects` are dispatched in order after the new state is published.
// -----------------------------------------------------------------------------
template <typename Machine>
struct Transition {
  typename Machine::State next;
  std::vector<typename Machine::Effect> effects;
};

// -----------------------------------------------------------------------------
// TransitionTable: explicit (state kind, event kind) -> handler map
// -----------------------------------------------------------------------------
//
// @brief  The whole behaviour of a state machine as data.
//
// @details
// `Machine` is a traits type providing:
//   StateKind, EventKind     enums used as the map key
//   State                    EngineState<StateKind, Context>
//   Event, Effect            std::variant tagged unions
//   static EventKind kindOf(const Event&)
//
// A handler receives the full current state and the event and returns the
// next state with its effects. It may return std::nullopt to decline (a
// guard such as "Retry only when attempts > 0"); a declined or absent entry
// leaves state and context unchanged and emits nothing.
//
// Thread model:
//   Built once at engine construction, then only read on the engine lane.
// -----------------------------------------------------------------------------
template <typename Machine>
class TransitionTable {
 public:
  using StateKind = typename Machine::StateKind;
  using EventKind = typename Machine::EventKind;
  using State = typename Machine::State;
  using Event = typename Machine::Event;
  using Result = std::optional<Transition<Machine>>;
  using Handler = std::function<Result(const State&, const Event&)>;

  // Registers (or replaces) the handler for one (state, event) pair.
  TransitionTable& on(StateKind state, EventKind event, Handler handler) {
    handlers_[std::make_pair(state, event)] = std::move(handler);
    return *this;
  }

  // Registers the same handler for several source states.
  TransitionTable& on(std::initializer_list<StateKind> states, EventKind event,
                      const Handler& handler) {
    for (StateKind state : states) {
      on(state, event, handler);
    }
    return *this;
  }

  bool contains(StateKind state, EventKind event) const {
    return handlers_.count(std::make_pair(state, event)) != 0;
  }

  // -------------------------------------------------------------------------
  // apply(state, event)
  // -------------------------------------------------------------------------
  // Returns the transition for `event` in `state`, or std::nullopt when the
  // pair is undefined or its handler declined.
  // -------------------------------------------------------------------------
  Result apply(const State& state, const Event& event) const {
    const auto it =
        handlers_.find(std::make_pair(state.kind, Machine::kindOf(event)));
    if (it == handlers_.end()) {
      return std::nullopt;
    }
    return it->second(state, event);
  }

 private:
  std::map<std::pair<StateKind, EventKind>, Handler> handlers_;
};

}  // namespace event_engine
}  // namespace pulse
