#include "pulse/transport/zmq_transport.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <utility>

namespace pulse {
namespace transport {

ZmqTransport::ZmqTransport(std::string relay_endpoint, std::string origin)
    : relay_endpoint_(std::move(relay_endpoint)), origin_(std::move(origin)) {}

// -----------------------------------------------------------------------------
// encodeEnvelope()
// -----------------------------------------------------------------------------
std::string ZmqTransport::encodeEnvelope(const Request& request,
                                         const std::string& origin) {
  nlohmann::json j;
  j["method"] = request.method;
  j["url"] = origin + request.url();
  j["timeout_ms"] = request.timeout.count();
  j["endpoint"] = toString(request.endpoint);
  return j.dump();
}

// -----------------------------------------------------------------------------
// decodeReply()
// -----------------------------------------------------------------------------
TransportResult ZmqTransport::decodeReply(const std::string& reply) {
  try {
    const auto j = nlohmann::json::parse(reply);

    if (j.contains("error")) {
      return EndpointError::transport(j.at("error").get<std::string>());
    }

    Response response;
    response.status = j.at("status").get<int>();
    response.body = j.value("body", std::string());
    return response;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[ZmqTransport] malformed relay reply: " << e.what() << "\n";
    return EndpointError::transport(std::string("malformed relay reply: ") +
                                    e.what());
  }
}

// -----------------------------------------------------------------------------
// execute()
// -----------------------------------------------------------------------------
TransportResult ZmqTransport::execute(const Request& request,
                                      const CancellationToken& token) {
  if (token.cancelled()) {
    return EndpointError::cancelled();
  }

  const auto deadline = std::chrono::steady_clock::now() + request.timeout;

  try {
    zmq::socket_t socket(context_, zmq::socket_type::req);
    socket.set(zmq::sockopt::linger, 0);
    socket.set(zmq::sockopt::rcvtimeo, kPollSliceMs);
    socket.connect(relay_endpoint_);

    const std::string envelope = encodeEnvelope(request, origin_);
    zmq::message_t out(envelope.data(), envelope.size());
    socket.send(out, zmq::send_flags::none);

    while (true) {
      zmq::message_t in;
      auto result = socket.recv(in, zmq::recv_flags::none);

      if (result.has_value()) {
        return decodeReply(in.to_string());
      }

      // Slice elapsed with no reply.
      if (token.cancelled()) {
        return EndpointError::cancelled();
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        return EndpointError::transport("request timed out");
      }
    }
  } catch (const zmq::error_t& e) {
    std::cerr << "[ZmqTransport] " << relay_endpoint_ << ": " << e.what()
              << "\n";
    return EndpointError::transport(e.what());
  }
}

}  // namespace transport
}  // namespace pulse
