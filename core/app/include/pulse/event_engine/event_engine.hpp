#pragma once

#include "pulse/concurrent/cancellation.hpp"
#include "pulse/concurrent/executor.hpp"
#include "pulse/event_engine/effect_dispatcher.hpp"
#include "pulse/event_engine/transition_table.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace pulse {
namespace event_engine {

// -----------------------------------------------------------------------------
// EventEngine: serial state machine runner
// -----------------------------------------------------------------------------
//
// @brief  Feeds events through a TransitionTable one at a time on a lane and
//         hands the resulting effects to an EffectDispatcher.
//
// @details
// send(event) posts to the lane. Processing one event:
//   1. table.apply(current, event); std::nullopt → nothing happens.
//   2. The new state is published (currentState() readers see it).
//   3. Transition listeners run with (from, event, to, effects).
//   4. Effects are dispatched in emitted order.
//
// Completion events produced by effects come back through the dispatcher's
// sink together with the effect's CancellationToken. They are posted to the
// same lane and discarded there if the token has been cancelled by then.
//
// Thread model:
//   send() and currentState() from any thread. Everything else runs on the
//   lane. The only lock guards the state pointer and the listener list.
//
// Ownership:
//   Holds references to the dispatcher and the lane; both are owned by the
//   engine wrapper and must outlive this object.
// -----------------------------------------------------------------------------
template <typename Machine>
class EventEngine {
 public:
  using State = typename Machine::State;
  using Event = typename Machine::Event;
  using Effect = typename Machine::Effect;
  using Table = TransitionTable<Machine>;
  using Dispatcher = EffectDispatcher<Machine>;

  using TransitionListener =
      std::function<void(const State& from, const Event& event,
                         const State& to, const std::vector<Effect>& effects)>;

  EventEngine(Table table, Dispatcher& dispatcher, IExecutor& lane,
              State initial)
      : table_(std::move(table)),
        dispatcher_(dispatcher),
        lane_(lane),
        state_(std::make_shared<const State>(std::move(initial))) {
    dispatcher_.bind([this](const CancellationToken& token, Event event) {
      lane_.post([this, token, event = std::move(event)] {
        if (token.cancelled()) {
          return;
        }
        process(event);
      });
    });
  }

  EventEngine(const EventEngine&) = delete;
  EventEngine& operator=(const EventEngine&) = delete;

  // Enqueues `event` on the lane.
  void send(Event event) {
    lane_.post([this, event = std::move(event)] { process(event); });
  }

  // Snapshot of the state after the most recently processed event.
  std::shared_ptr<const State> currentState() const {
    std::lock_guard lock(mutex_);
    return state_;
  }

  // Listeners run on the lane after the state swap, before effects.
  void addTransitionListener(TransitionListener listener) {
    std::lock_guard lock(mutex_);
    listeners_.push_back(std::move(listener));
  }

 private:
  void process(const Event& event) {
    std::shared_ptr<const State> from;
    std::vector<TransitionListener> listeners;
    {
      std::lock_guard lock(mutex_);
      from = state_;
    }

    auto transition = table_.apply(*from, event);
    if (!transition) {
      return;
    }

    auto to = std::make_shared<const State>(std::move(transition->next));
    {
      std::lock_guard lock(mutex_);
      state_ = to;
      listeners = listeners_;
    }

    for (const auto& listener : listeners) {
      listener(*from, event, *to, transition->effects);
    }

    for (const auto& effect : transition->effects) {
      dispatcher_.dispatch(effect);
    }
  }

  Table table_;
  Dispatcher& dispatcher_;
  IExecutor& lane_;

  mutable std::mutex mutex_;
  std::shared_ptr<const State> state_;
  std::vector<TransitionListener> listeners_;
};

}  // namespace event_engine
}  // namespace pulse
