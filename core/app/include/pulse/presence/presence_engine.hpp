#pragma once

#include "pulse/concurrent/executor.hpp"
#include "pulse/config/configuration.hpp"
#include "pulse/event_engine/effect_dispatcher.hpp"
#include "pulse/event_engine/event_engine.hpp"
#include "pulse/notify/notification_bus.hpp"
#include "pulse/presence/presence_effect_handler.hpp"
#include "pulse/presence/presence_machine.hpp"
#include "pulse/time/i_timer_service.hpp"
#include "pulse/transport/i_transport.hpp"

#include <memory>

namespace pulse {
namespace presence {

// -----------------------------------------------------------------------------
// PresenceEngine: the Presence Event Engine
// -----------------------------------------------------------------------------
//
// @brief  Announces the user on joined channels with periodic heartbeats and
//         leave requests.
//
// @details
// Same composition as SubscribeEngine: EffectHandler, EffectDispatcher,
// EventEngine. The cooldown between heartbeats is
// Configuration::heartbeat_interval; RealtimeClient only constructs this
// engine when that interval is positive.
//
// Initial state is HeartbeatInactive with an empty context.
//
// Thread model and ownership: as SubscribeEngine.
// -----------------------------------------------------------------------------
class PresenceEngine {
 public:
  PresenceEngine(const Configuration& config, transport::ITransport& transport,
                 IExecutor& lane, IExecutor& io, ITimerService& timers,
                 NotificationBus& bus);

  PresenceEngine(const PresenceEngine&) = delete;
  PresenceEngine& operator=(const PresenceEngine&) = delete;
  PresenceEngine(PresenceEngine&&) = delete;
  PresenceEngine& operator=(PresenceEngine&&) = delete;

  void send(Event event) { engine_.send(std::move(event)); }

  std::shared_ptr<const State> currentState() const {
    return engine_.currentState();
  }

  void addTransitionListener(
      event_engine::EventEngine<Machine>::TransitionListener listener) {
    engine_.addTransitionListener(std::move(listener));
  }

  void cancelAll() { dispatcher_.cancelAll(); }

 private:
  EffectHandler handler_;
  event_engine::EffectDispatcher<Machine> dispatcher_;
  event_engine::EventEngine<Machine> engine_;
};

}  // namespace presence
}  // namespace pulse
