#pragma once

#include "pulse/domain/channel_set.hpp"
#include "pulse/domain/cursor.hpp"
#include "pulse/errors/endpoint_error.hpp"

#include <optional>

namespace pulse {
namespace domain {

// -----------------------------------------------------------------------------
// StatusCategory: connectivity milestones of the subscription engine
// -----------------------------------------------------------------------------
enum class StatusCategory {
  Connected,                 // first handshake succeeded
  Reconnected,               // receive succeeded after one or more retries
  Reconnecting,              // first receive failure that will be retried
  Disconnected,              // intentional disconnect or unsubscribe-all
  DisconnectedUnexpectedly,  // receive retries exhausted
  ConnectionError,           // handshake retries exhausted
  SubscriptionChanged,       // channel/group set changed while connected
};

const char* toString(StatusCategory category);

// -----------------------------------------------------------------------------
// Status: emitted by the subscription engine through the NotificationBus
// -----------------------------------------------------------------------------
//
// @brief  Snapshot of what the engine was working with when the milestone
//         happened.
//
// @details
// `cursor` is set for Connected, Reconnected and SubscriptionChanged.
// `error` is set for Reconnecting, DisconnectedUnexpectedly and
// ConnectionError.
// -----------------------------------------------------------------------------
struct Status {
  StatusCategory category{StatusCategory::Connected};
  ChannelSet channels;
  ChannelSet groups;
  std::optional<Cursor> cursor;
  std::optional<EndpointError> error;
};

// -----------------------------------------------------------------------------
// HeartbeatStatus: outcome of one heartbeat, emitted by the presence engine
// -----------------------------------------------------------------------------
// Only published when the configuration asks for it
// (announce_successful_heartbeats / announce_failed_heartbeats).
// -----------------------------------------------------------------------------
struct HeartbeatStatus {
  bool success{true};
  ChannelSet channels;
  ChannelSet groups;
  std::optional<EndpointError> error;
};

}  // namespace domain
}  // namespace pulse
