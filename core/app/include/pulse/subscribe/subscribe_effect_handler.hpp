#pragma once

#include "pulse/concurrent/cancellation.hpp"
#include "pulse/concurrent/executor.hpp"
#include "pulse/config/configuration.hpp"
#include "pulse/dedup/dedup_cache.hpp"
#include "pulse/event_engine/effect_dispatcher.hpp"
#include "pulse/notify/notification_bus.hpp"
#include "pulse/subscribe/subscribe_machine.hpp"
#include "pulse/time/i_timer_service.hpp"
#include "pulse/transport/i_transport.hpp"

#include <optional>

namespace pulse {
namespace subscribe {

// -----------------------------------------------------------------------------
// EffectHandler: executes subscription effects
// -----------------------------------------------------------------------------
//
// @brief  Turns effects into network calls, timers and notifications, and
//         turns their outcomes back into events.
//
// @details
//   Handshake / HandshakeReconnect   handshake request on the I/O pool
//                                    → HandshakeSuccess | HandshakeFailure
//   ReceiveMessages / ReceiveReconnect  long-poll on the I/O pool
//                                    → ReceiveSuccess | ReceiveFailure
//   Wait                             timer → Retry
//   EmitMessages                     dedup, then publish each Message
//   EmitStatus                       publish the Status
//
// Cancelled requests emit nothing: the token is checked before and after
// the transport call and a Cancellation error is dropped.
//
// Thread model:
//   operator() runs on the engine lane. Emit* effects complete there, which
//   is what keeps the DedupCache single-threaded. Network work runs on `io`;
//   timer callbacks run on the timer thread. Both only call `emit`.
//
// Ownership:
//   Owns the DedupCache. Holds references to the transport, the I/O pool,
//   the timer service and the bus, all owned by RealtimeClient (or a test).
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
  void handshake(const domain::ChannelSet& channels,
                 const domain::ChannelSet& groups,
                 const CancellationToken& token, const Emit& emit);
  void receive(const domain::ChannelSet& channels,
               const domain::ChannelSet& groups, const domain::Cursor& cursor,
               const CancellationToken& token, const Emit& emit);
  void wait(const effect::Wait& wait, const CancellationToken& token,
            const Emit& emit);
  void emitMessages(const effect::EmitMessages& effect);

  Configuration config_;
  transport::ITransport& transport_;
  IExecutor& io_;
  ITimerService& timers_;
  NotificationBus& bus_;
  std::optional<DedupCache> dedup_;
};

}  // namespace subscribe
}  // namespace pulse
