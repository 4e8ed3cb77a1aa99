#pragma once

#include "pulse/concurrent/executor.hpp"
#include "pulse/config/configuration.hpp"
#include "pulse/event_engine/effect_dispatcher.hpp"
#include "pulse/event_engine/event_engine.hpp"
#include "pulse/notify/notification_bus.hpp"
#include "pulse/subscribe/subscribe_effect_handler.hpp"
#include "pulse/subscribe/subscribe_machine.hpp"
#include "pulse/time/i_timer_service.hpp"
#include "pulse/transport/i_transport.hpp"

#include <memory>

namespace pulse {
namespace subscribe {

// -----------------------------------------------------------------------------
// SubscribeEngine: the Subscription Event Engine
// -----------------------------------------------------------------------------
//
// @brief  Keeps the channel/group subscription alive: handshake, long-poll
//         receive loop, retry with backoff, and status reporting.
//
// @details
// Composition (construction order):
//   1. EffectHandler     network, timers, dedup, notifications
//   2. EffectDispatcher  one cancellation source per EffectChannel
//   3. EventEngine       transition table built from the configuration
//
// Initial state is Unsubscribed with an empty context.
//
// Thread model:
//   send() and currentState() from any thread. Transitions and effect
//   dispatch run on `lane`. Requests run on `io`.
//
// Ownership:
//   Non-owning references to every constructor argument except the
//   configuration, which is copied. The caller must stop `io` and `timers`
//   before destroying the engine so no effect completes into a dead object.
// -----------------------------------------------------------------------------
class SubscribeEngine {
 public:
  SubscribeEngine(const Configuration& config,
                  transport::ITransport& transport, IExecutor& lane,
                  IExecutor& io, ITimerService& timers, NotificationBus& bus);

  SubscribeEngine(const SubscribeEngine&) = delete;
  SubscribeEngine& operator=(const SubscribeEngine&) = delete;
  SubscribeEngine(SubscribeEngine&&) = delete;
  SubscribeEngine& operator=(SubscribeEngine&&) = delete;

  void send(Event event) { engine_.send(std::move(event)); }

  std::shared_ptr<const State> currentState() const {
    return engine_.currentState();
  }

  void addTransitionListener(
      event_engine::EventEngine<Machine>::TransitionListener listener) {
    engine_.addTransitionListener(std::move(listener));
  }

  // Cancels the outstanding handshake/receive and any retry wait. Used on
  // shutdown; the state is left as it is.
  void cancelAll() { dispatcher_.cancelAll(); }

 private:
  EffectHandler handler_;
  event_engine::EffectDispatcher<Machine> dispatcher_;
  event_engine::EventEngine<Machine> engine_;
};

}  // namespace subscribe
}  // namespace pulse
