#pragma once

#include "pulse/concurrent/serial_executor.hpp"
#include "pulse/concurrent/thread_pool_executor.hpp"
#include "pulse/config/configuration.hpp"
#include "pulse/domain/channel_set.hpp"
#include "pulse/domain/cursor.hpp"
#include "pulse/notify/notification_bus.hpp"
#include "pulse/presence/presence_engine.hpp"
#include "pulse/subscribe/subscribe_engine.hpp"
#include "pulse/time/live_timer_service.hpp"
#include "pulse/transport/i_transport.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

namespace pulse {

// -----------------------------------------------------------------------------
// RealtimeClient
// -----------------------------------------------------------------------------
//
// @brief  Application-facing root of the realtime core. Owns both event
//         engines and every thread they run on.
//
// @details
// The client keeps the subscription intent (the full channel and group sets)
// and always sends complete sets to the subscription engine, so the engine
// never has to merge partial updates.
//
// Thread layout:
//
//   SubscribeLane thread   → subscription engine transitions and emits
//   PresenceLane thread    → presence engine transitions and emits
//   IoPool (N threads)     → ITransport::execute() for every request
//   LiveTimerService       → retry waits and heartbeat cooldowns
//
//   caller thread          → subscribe()/join()/... only enqueue events
//
// The presence engine exists only when Configuration::heartbeat_interval is
// positive. With presence_follow_subscription set, subscribe() and
// unsubscribe() also join and leave the same channels ("-pnpres" names
// excluded).
//
// Argument errors (both sets empty, an empty name, a name containing ',')
// throw ConfigurationError before any event is sent.
//
// Thread model:
//   All public methods may be called from any thread. start()/stop() are
//   meant for the owning thread.
//
// Ownership:
//   RealtimeClient
//    ├── bus_               (NotificationBus: value member)
//    ├── subscribe_lane_    (SerialExecutor: value member)
//    ├── presence_lane_     (SerialExecutor: value member)
//    ├── io_                (ThreadPoolExecutor: value member)
//    ├── timers_            (LiveTimerService: value member)
//    ├── subscribe_engine_  (unique_ptr<SubscribeEngine>)
//    ├── presence_engine_   (unique_ptr<PresenceEngine>, may be null)
//    └── transport_         (ITransport&: non-owning, must outlive client)
//
// Engines are declared after the executors so they are destroyed first.
// -----------------------------------------------------------------------------
class RealtimeClient {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  config     Validated here; throws ConfigurationError.
  // @param  transport  Request executor. Must outlive the client.
  //
  // @details
  // Builds the engines but spawns no threads. Calls made before start() are
  // queued on the lanes and processed once start() runs.
  // -------------------------------------------------------------------------
  RealtimeClient(Configuration config, transport::ITransport& transport);

  // Destructor calls stop().
  ~RealtimeClient();

  RealtimeClient(const RealtimeClient&) = delete;
  RealtimeClient& operator=(const RealtimeClient&) = delete;
  RealtimeClient(RealtimeClient&&) = delete;
  RealtimeClient& operator=(RealtimeClient&&) = delete;

  // Starts timers, the I/O pool and both lanes. Idempotent.
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Shuts down all threads. Engine state is kept.
  //
  // @details
  // Shutdown sequence:
  //   1. Flush both lanes (bounded wait) so events sent just before stop(),
  //      such as unsubscribeAll(), are processed and their leave requests
  //      queued.
  //   2. Stop the lanes; no more transitions.
  //   3. Cancel every managed effect (long-poll, heartbeat, waits).
  //   4. Stop the timer service.
  //   5. Stop the I/O pool; queued leave requests are sent, cancelled
  //      requests return immediately.
  //
  // Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // --- Subscription ---------------------------------------------------------

  // Adds to the subscription. With `cursor`, the engine restores from that
  // position instead of keeping (or dropping) its own.
  void subscribe(const domain::ChannelSet& channels,
                 const domain::ChannelSet& groups = {},
                 std::optional<domain::Cursor> cursor = std::nullopt);

  // Names that are not subscribed are skipped. When none of them is, no event
  // is sent and the running long-poll is left alone.
  void unsubscribe(const domain::ChannelSet& channels,
                   const domain::ChannelSet& groups = {});

  void unsubscribeAll();

  // Leaves a stopped or failed state. Receive* states resume from the last
  // cursor (or `cursor`) without a new handshake.
  void reconnect(std::optional<domain::Cursor> cursor = std::nullopt);

  void disconnect();

  // --- Presence -------------------------------------------------------------

  void join(const domain::ChannelSet& channels,
            const domain::ChannelSet& groups = {});
  void leave(const domain::ChannelSet& channels,
             const domain::ChannelSet& groups = {});
  void leaveAll();

  // Marks the network as passively lost: later disconnect()/leaveAll() skip
  // the leave request the server could not receive anyway.
  void setOffline(bool offline) { offline_.store(offline); }

  // --- Observation ----------------------------------------------------------

  NotificationBus& notifications() { return bus_; }

  std::shared_ptr<const subscribe::State> subscriptionState() const;

  // nullptr when the presence engine is disabled.
  std::shared_ptr<const presence::State> presenceState() const;

  domain::ChannelSet subscribedChannels() const;
  domain::ChannelSet subscribedGroups() const;

  bool presenceEnabled() const { return presence_engine_ != nullptr; }

  const Configuration& configuration() const { return config_; }

 private:
  static void validateNames(const domain::ChannelSet& channels,
                            const domain::ChannelSet& groups,
                            const char* operation);

  bool followsSubscription() const {
    return presence_engine_ && config_.presence_follow_subscription;
  }

  void flushLanes();

  Configuration config_;
  transport::ITransport& transport_;

  NotificationBus bus_;
  SerialExecutor subscribe_lane_{"SubscribeLane"};
  SerialExecutor presence_lane_{"PresenceLane"};
  ThreadPoolExecutor io_;
  LiveTimerService timers_;

  std::unique_ptr<subscribe::SubscribeEngine> subscribe_engine_;
  std::unique_ptr<presence::PresenceEngine> presence_engine_;

  mutable std::mutex mutex_;  // Protects channels_ and groups_
  domain::ChannelSet channels_;
  domain::ChannelSet groups_;

  std::atomic<bool> offline_{false};
  bool running_{false};
};

}  // namespace pulse
