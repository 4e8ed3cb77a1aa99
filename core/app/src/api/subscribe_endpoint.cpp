#include "pulse/api/subscribe_endpoint.hpp"

#include "pulse/api/url_encoding.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace pulse {
namespace api {

namespace {

transport::Request makeSubscribeRequest(const Configuration& config,
                                        const domain::ChannelSet& channels,
                                        const domain::ChannelSet& groups,
                                        const domain::Cursor& cursor,
                                        bool handshake) {
  transport::Request request;
  request.endpoint = EndpointKind::Subscribe;
  request.method = "GET";
  request.timeout = config.subscribe_request_timeout;

  const std::string channel_path =
      channels.empty() ? "," : encodeNameList(channels);
  request.path = "/v2/subscribe/" + percentEncode(config.subscribe_key) + "/" +
                 channel_path + "/0";

  request.query.emplace_back("tt", handshake ? "0" : cursor.timetoken);
  if (!handshake) {
    request.query.emplace_back("tr", std::to_string(cursor.region));
  }
  request.query.emplace_back("ee", "");
  request.query.emplace_back("uuid", percentEncode(config.user_id));

  if (!groups.empty()) {
    request.query.emplace_back("channel-group", encodeNameList(groups));
  }
  if (!config.filter_expression.empty()) {
    request.query.emplace_back("filter-expr",
                               percentEncode(config.filter_expression));
  }
  if (handshake && config.presenceEnabled()) {
    request.query.emplace_back(
        "heartbeat", std::to_string(config.presence_timeout.count()));
  }
  return request;
}

domain::Cursor cursorFromJson(const nlohmann::json& j) {
  domain::Cursor cursor;
  // The server sends "t" as a string; accept a number too.
  const auto& tt = j.at("t");
  cursor.timetoken = tt.is_string() ? tt.get<std::string>()
                                    : std::to_string(tt.get<long long>());
  cursor.region = j.value("r", 0);
  return cursor;
}

domain::Message messageFromJson(const nlohmann::json& j) {
  domain::Message message;
  message.channel = j.at("c").get<std::string>();

  const std::string via = j.value("b", std::string());
  if (via != message.channel) {
    message.subscription = via;
  }

  message.payload = j.contains("d") ? j.at("d").dump() : "null";
  if (j.contains("p")) {
    message.published = cursorFromJson(j.at("p"));
  }
  message.publisher = j.value("i", std::string());
  if (j.contains("s") && j.at("s").is_number_integer()) {
    message.sequence = j.at("s").get<std::int64_t>();
  }
  message.type = static_cast<domain::MessageType>(j.value("e", 0));
  return message;
}

}  // namespace

std::string encodeNameList(const domain::ChannelSet& names) {
  std::string out;
  for (const auto& name : names) {
    if (!out.empty()) {
      out += ',';
    }
    out += percentEncode(name);
  }
  return out;
}

transport::Request makeHandshakeRequest(const Configuration& config,
                                        const domain::ChannelSet& channels,
                                        const domain::ChannelSet& groups) {
  return makeSubscribeRequest(config, channels, groups, domain::Cursor{},
                              true);
}

transport::Request makeReceiveRequest(const Configuration& config,
                                      const domain::ChannelSet& channels,
                                      const domain::ChannelSet& groups,
                                      const domain::Cursor& cursor) {
  return makeSubscribeRequest(config, channels, groups, cursor, false);
}

// -----------------------------------------------------------------------------
// errorFromResponse()
// -----------------------------------------------------------------------------
EndpointError errorFromResponse(const transport::Response& response) {
  std::string message = "HTTP " + std::to_string(response.status);

  const auto j = nlohmann::json::parse(response.body, nullptr, false);
  if (!j.is_discarded() && j.is_object() && j.contains("message") &&
      j.at("message").is_string()) {
    message = j.at("message").get<std::string>();
  }
  return EndpointError::server(response.status, message);
}

// -----------------------------------------------------------------------------
// parseSubscribeResponse()
// -----------------------------------------------------------------------------
SubscribeOutcome parseSubscribeResponse(const transport::Response& response) {
  if (response.status < 200 || response.status >= 300) {
    return errorFromResponse(response);
  }

  try {
    const auto j = nlohmann::json::parse(response.body);

    SubscribeResult result;
    result.cursor = cursorFromJson(j.at("t"));
    if (j.contains("m")) {
      for (const auto& item : j.at("m")) {
        result.messages.push_back(messageFromJson(item));
      }
    }
    return result;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[SubscribeEndpoint] malformed response: " << e.what()
              << "\n";
    return EndpointError::server(
        response.status, std::string("malformed subscribe response: ") +
                             e.what());
  }
}

}  // namespace api
}  // namespace pulse
