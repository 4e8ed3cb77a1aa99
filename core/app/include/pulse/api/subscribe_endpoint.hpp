#pragma once

#include "pulse/config/configuration.hpp"
#include "pulse/domain/channel_set.hpp"
#include "pulse/domain/cursor.hpp"
#include "pulse/domain/message.hpp"
#include "pulse/errors/endpoint_error.hpp"
#include "pulse/transport/request.hpp"

#include <string>
#include <variant>
#include <vector>

namespace pulse {
namespace api {

// -----------------------------------------------------------------------------
// Subscribe endpoint codec
// -----------------------------------------------------------------------------
//
// @brief  Builds handshake/receive requests and decodes their responses.
//
// @details
// Both calls hit GET /v2/subscribe/{subkey}/{channels}/0. An empty channel
// list is sent as "," (group-only subscription).
//
//   handshake  tt=0, ee, uuid, [channel-group], [filter-expr], [heartbeat]
//   receive    tt, tr, ee, uuid, [channel-group], [filter-expr]
//
// `heartbeat` carries the presence timeout and is only sent when the
// presence engine is enabled.
//
// Response body:
//   {"t":{"t":"17000000000000000","r":4},
//    "m":[{"c":"ch","b":"grp","d":{...},"p":{"t":"...","r":4},
//          "i":"publisher","s":12,"e":0}, ...]}
//
// Decoding never throws: nlohmann::json::exception is caught here and turned
// into a Server EndpointError.
// -----------------------------------------------------------------------------

struct SubscribeResult {
  domain::Cursor cursor;
  std::vector<domain::Message> messages;
};

using SubscribeOutcome = std::variant<SubscribeResult, EndpointError>;

transport::Request makeHandshakeRequest(const Configuration& config,
                                        const domain::ChannelSet& channels,
                                        const domain::ChannelSet& groups);

transport::Request makeReceiveRequest(const Configuration& config,
                                      const domain::ChannelSet& channels,
                                      const domain::ChannelSet& groups,
                                      const domain::Cursor& cursor);

SubscribeOutcome parseSubscribeResponse(const transport::Response& response);

// Shared with the presence codec: non-2xx responses become Server errors
// carrying the `message` field of a JSON body when there is one.
EndpointError errorFromResponse(const transport::Response& response);

// Percent-encodes every name and joins with ','.
std::string encodeNameList(const domain::ChannelSet& names);

}  // namespace api
}  // namespace pulse
