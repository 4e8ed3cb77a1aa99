#include "pulse/engine/realtime_client.hpp"

#include "pulse/errors/configuration_error.hpp"

#include <chrono>
#include <future>
#include <iostream>
#include <utility>

namespace pulse {

namespace {

// Upper bound on how long stop() waits for a lane to drain.
constexpr auto kLaneFlushTimeout = std::chrono::seconds(2);

void flushLane(SerialExecutor& lane) {
  auto done = std::make_shared<std::promise<void>>();
  auto flushed = done->get_future();
  lane.post([done] { done->set_value(); });

  if (flushed.wait_for(kLaneFlushTimeout) != std::future_status::ready) {
    std::cerr << "[RealtimeClient] " << lane.name()
              << " did not drain before shutdown\n";
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
RealtimeClient::RealtimeClient(Configuration config,
                               transport::ITransport& transport)
    : config_(std::move(config)),
      transport_(transport),
      io_(config_.io_threads, "IoPool") {
  config_.validate();

  subscribe_engine_ = std::make_unique<subscribe::SubscribeEngine>(
      config_, transport_, subscribe_lane_, io_, timers_, bus_);

  if (config_.presenceEnabled()) {
    presence_engine_ = std::make_unique<presence::PresenceEngine>(
        config_, transport_, presence_lane_, io_, timers_, bus_);
  }
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
RealtimeClient::~RealtimeClient() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void RealtimeClient::start() {
  if (running_) {
    return;
  }

  timers_.start();
  io_.start();
  subscribe_lane_.start();
  presence_lane_.start();

  running_ = true;

  std::cout << "[RealtimeClient] started. io_threads=" << io_.threadCount();
  if (presence_engine_) {
    std::cout << " heartbeat_interval=" << config_.heartbeat_interval.count()
              << "s";
  } else {
    std::cout << " presence=off";
  }
  std::cout << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void RealtimeClient::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Let already-sent events finish --------------------------------
  flushLanes();

  // ---  2) Freeze the engines ---------------------------------------------
  subscribe_lane_.stop();
  presence_lane_.stop();

  // ---  3) Abort everything in flight -------------------------------------
  subscribe_engine_->cancelAll();
  if (presence_engine_) {
    presence_engine_->cancelAll();
  }

  // ---  4) / 5) Timers, then I/O ------------------------------------------
  timers_.stop();
  io_.stop();

  running_ = false;

  std::cout << "[RealtimeClient] stopped. All threads joined.\n";
}

void RealtimeClient::flushLanes() {
  flushLane(subscribe_lane_);
  if (presence_engine_) {
    flushLane(presence_lane_);
  }
}

// -----------------------------------------------------------------------------
// validateNames()
// -----------------------------------------------------------------------------
void RealtimeClient::validateNames(const domain::ChannelSet& channels,
                                   const domain::ChannelSet& groups,
                                   const char* operation) {
  if (channels.empty() && groups.empty()) {
    throw ConfigurationError(std::string(operation) +
                             ": at least one channel or group is required");
  }

  auto check = [operation](const domain::ChannelSet& names, const char* what) {
    for (const auto& name : names) {
      if (name.empty()) {
        throw ConfigurationError(std::string(operation) + ": empty " + what +
                                 " name");
      }
      if (name.find(',') != std::string::npos) {
        throw ConfigurationError(std::string(operation) + ": " + what +
                                 " name '" + name + "' contains ','");
      }
    }
  };
  check(channels, "channel");
  check(groups, "group");
}

// -----------------------------------------------------------------------------
// subscribe()
// -----------------------------------------------------------------------------
void RealtimeClient::subscribe(const domain::ChannelSet& channels,
                               const domain::ChannelSet& groups,
                               std::optional<domain::Cursor> cursor) {
  validateNames(channels, groups, "subscribe");

  {
    // Held across send() so concurrent callers enqueue complete sets in the
    // same order they updated them.
    std::lock_guard lock(mutex_);
    channels_ = channels_.unionWith(channels);
    groups_ = groups_.unionWith(groups);

    if (cursor) {
      subscribe_engine_->send(
          subscribe::event::Restore{channels_, groups_, *cursor});
    } else {
      subscribe_engine_->send(
          subscribe::event::SubscriptionChange{channels_, groups_});
    }
  }

  if (followsSubscription()) {
    const auto announced = channels.withoutPresenceChannels();
    if (!announced.empty() || !groups.empty()) {
      presence_engine_->send(presence::event::Joined{announced, groups});
    }
  }
}

// -----------------------------------------------------------------------------
// unsubscribe()
// -----------------------------------------------------------------------------
void RealtimeClient::unsubscribe(const domain::ChannelSet& channels,
                                 const domain::ChannelSet& groups) {
  validateNames(channels, groups, "unsubscribe");

  {
    std::lock_guard lock(mutex_);
    auto remaining_channels = channels_.difference(channels);
    auto remaining_groups = groups_.difference(groups);
    if (remaining_channels == channels_ && remaining_groups == groups_) {
      // Nothing subscribed was named; keep the live long-poll.
      return;
    }
    channels_ = std::move(remaining_channels);
    groups_ = std::move(remaining_groups);
    subscribe_engine_->send(
        subscribe::event::SubscriptionChange{channels_, groups_});
  }

  if (followsSubscription()) {
    const auto announced = channels.withoutPresenceChannels();
    if (!announced.empty() || !groups.empty()) {
      presence_engine_->send(presence::event::Left{announced, groups});
    }
  }
}

void RealtimeClient::unsubscribeAll() {
  {
    std::lock_guard lock(mutex_);
    channels_ = domain::ChannelSet{};
    groups_ = domain::ChannelSet{};
    subscribe_engine_->send(subscribe::event::SubscriptionChange{});
  }

  if (followsSubscription()) {
    presence_engine_->send(presence::event::LeftAll{offline_.load()});
  }
}

// -----------------------------------------------------------------------------
// reconnect() / disconnect()
// -----------------------------------------------------------------------------
// Both engines follow: a disconnected client neither polls nor heartbeats.
// -----------------------------------------------------------------------------
void RealtimeClient::reconnect(std::optional<domain::Cursor> cursor) {
  offline_.store(false);
  subscribe_engine_->send(subscribe::event::Reconnect{std::move(cursor)});
  if (presence_engine_) {
    presence_engine_->send(presence::event::Reconnect{});
  }
}

void RealtimeClient::disconnect() {
  subscribe_engine_->send(subscribe::event::Disconnect{});
  if (presence_engine_) {
    presence_engine_->send(presence::event::Disconnect{offline_.load()});
  }
}

// -----------------------------------------------------------------------------
// join() / leave() / leaveAll()
// -----------------------------------------------------------------------------
void RealtimeClient::join(const domain::ChannelSet& channels,
                          const domain::ChannelSet& groups) {
  validateNames(channels, groups, "join");
  if (!presence_engine_) {
    std::cerr << "[RealtimeClient] join ignored: presence is disabled "
                 "(heartbeat_interval_s is 0)\n";
    return;
  }

  const auto announced = channels.withoutPresenceChannels();
  if (announced.empty() && groups.empty()) {
    return;
  }
  presence_engine_->send(presence::event::Joined{announced, groups});
}

void RealtimeClient::leave(const domain::ChannelSet& channels,
                           const domain::ChannelSet& groups) {
  validateNames(channels, groups, "leave");
  if (!presence_engine_) {
    std::cerr << "[RealtimeClient] leave ignored: presence is disabled\n";
    return;
  }

  const auto announced = channels.withoutPresenceChannels();
  if (announced.empty() && groups.empty()) {
    return;
  }
  presence_engine_->send(presence::event::Left{announced, groups});
}

void RealtimeClient::leaveAll() {
  if (!presence_engine_) {
    return;
  }
  presence_engine_->send(presence::event::LeftAll{offline_.load()});
}

// -----------------------------------------------------------------------------
// Observation
// -----------------------------------------------------------------------------
std::shared_ptr<const subscribe::State> RealtimeClient::subscriptionState()
    const {
  return subscribe_engine_->currentState();
}

std::shared_ptr<const presence::State> RealtimeClient::presenceState() const {
  if (!presence_engine_) {
    return nullptr;
  }
  return presence_engine_->currentState();
}

domain::ChannelSet RealtimeClient::subscribedChannels() const {
  std::lock_guard lock(mutex_);
  return channels_;
}

domain::ChannelSet RealtimeClient::subscribedGroups() const {
  std::lock_guard lock(mutex_);
  return groups_;
}

}  // namespace pulse
