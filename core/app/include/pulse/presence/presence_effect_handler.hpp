#pragma once

#include "pulse/concurrent/cancellation.hpp"
#include "pulse/concurrent/executor.hpp"
#include "pulse/config/configuration.hpp"
#include "pulse/event_engine/effect_dispatcher.hpp"
#include "pulse/notify/notification_bus.hpp"
#include "pulse/presence/presence_machine.hpp"
#include "pulse/time/i_timer_service.hpp"
#include "pulse/transport/i_transport.hpp"

namespace pulse {
namespace presence {

// -----------------------------------------------------------------------------
// EffectHandler: executes presence effects
// -----------------------------------------------------------------------------
//   Heartbeat            heartbeat request on the I/O pool
//                        → HeartbeatSuccess | HeartbeatFailure
//   Leave                leave request on the I/O pool, fire and forget;
//                        failures are logged only
//   Wait                 timer → TimesUp (cooldown) | Retry (backoff)
//   EmitHeartbeatStatus  publish on the bus
//
// Presence channels ("-pnpres") are stripped from every request.
//
// Thread model: same as subscribe::EffectHandler.
// -----------------------------------------------------------------------------
class EffectHandler {
 public:
  using Emit = event_engine::EffectDispatcher<Machine>::Emit;

  EffectHandler(const Configuration& config, transport::ITransport& transport,
                IExecutor& io, ITimerService& timers, NotificationBus& bus);

  EffectHandler(const EffectHandler&) = delete;
  EffectHandler& operator=(const EffectHandler&) = delete;

  void operator()(const Effect& effect, const CancellationToken& token,
                  const Emit& emit);

 private:
  void heartbeat(const effect::Heartbeat& heartbeat,
                 const CancellationToken& token, const Emit& emit);
  void leave(const effect::Leave& leave);
  void wait(const effect::Wait& wait, const CancellationToken& token,
            const Emit& emit);

  Configuration config_;
  transport::ITransport& transport_;
  IExecutor& io_;
  ITimerService& timers_;
  NotificationBus& bus_;
};

}  // namespace presence
}  // namespace pulse
