#include "pulse/api/presence_endpoint.hpp"

#include "pulse/api/subscribe_endpoint.hpp"
#include "pulse/api/url_encoding.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace pulse {
namespace api {

namespace {

transport::Request makePresenceRequest(const Configuration& config,
                                       const domain::ChannelSet& channels,
                                       const domain::ChannelSet& groups,
                                       EndpointKind endpoint,
                                       const char* action) {
  transport::Request request;
  request.endpoint = endpoint;
  request.method = "GET";
  request.timeout = config.transactional_request_timeout;

  const std::string channel_path =
      channels.empty() ? "," : encodeNameList(channels);
  request.path = "/v2/presence/sub-key/" + percentEncode(config.subscribe_key) +
                 "/channel/" + channel_path + "/" + action;

  if (endpoint == EndpointKind::Heartbeat) {
    request.query.emplace_back(
        "heartbeat", std::to_string(config.presence_timeout.count()));
  }
  request.query.emplace_back("uuid", percentEncode(config.user_id));
  if (!groups.empty()) {
    request.query.emplace_back("channel-group", encodeNameList(groups));
  }
  return request;
}

}  // namespace

transport::Request makeHeartbeatRequest(const Configuration& config,
                                        const domain::ChannelSet& channels,
                                        const domain::ChannelSet& groups) {
  return makePresenceRequest(config, channels, groups, EndpointKind::Heartbeat,
                             "heartbeat");
}

transport::Request makeLeaveRequest(const Configuration& config,
                                    const domain::ChannelSet& channels,
                                    const domain::ChannelSet& groups) {
  return makePresenceRequest(config, channels, groups, EndpointKind::Leave,
                             "leave");
}

// -----------------------------------------------------------------------------
// parsePresenceResponse()
// -----------------------------------------------------------------------------
// The success body is {"status":200,"message":"OK","service":"Presence"}.
// Only its well-formedness is checked; an empty body is accepted.
// -----------------------------------------------------------------------------
std::optional<EndpointError> parsePresenceResponse(
    const transport::Response& response) {
  if (response.status < 200 || response.status >= 300) {
    return errorFromResponse(response);
  }
  if (response.body.empty()) {
    return std::nullopt;
  }

  try {
    const auto j = nlohmann::json::parse(response.body);
    if (j.is_object() && j.value("error", false)) {
      return EndpointError::server(j.value("status", response.status),
                                   j.value("message", std::string("error")));
    }
  } catch (const nlohmann::json::exception& e) {
    return EndpointError::server(
        response.status,
        std::string("malformed presence response: ") + e.what());
  }
  return std::nullopt;
}

}  // namespace api
}  // namespace pulse
