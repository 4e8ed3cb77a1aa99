#pragma once

#include "pulse/config/configuration.hpp"
#include "pulse/domain/channel_set.hpp"
#include "pulse/errors/endpoint_error.hpp"
#include "pulse/transport/request.hpp"

#include <optional>

namespace pulse {
namespace api {

// -----------------------------------------------------------------------------
// Presence endpoint codec
// -----------------------------------------------------------------------------
//   heartbeat  GET /v2/presence/sub-key/{subkey}/channel/{channels}/heartbeat
//              heartbeat=<presence timeout>, uuid, [channel-group]
//   leave      GET /v2/presence/sub-key/{subkey}/channel/{channels}/leave
//              uuid, [channel-group]
//
// Callers pass sets already stripped of "-pnpres" names. An empty channel
// list is sent as ",". Both use the transactional request timeout.
// -----------------------------------------------------------------------------

transport::Request makeHeartbeatRequest(const Configuration& config,
                                        const domain::ChannelSet& channels,
                                        const domain::ChannelSet& groups);

transport::Request makeLeaveRequest(const Configuration& config,
                                    const domain::ChannelSet& channels,
                                    const domain::ChannelSet& groups);

// nullopt on success; a Server error for non-2xx or a malformed body.
std::optional<EndpointError> parsePresenceResponse(
    const transport::Response& response);

}  // namespace api
}  // namespace pulse
