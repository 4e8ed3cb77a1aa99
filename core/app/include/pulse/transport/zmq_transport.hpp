#pragma once

#include "pulse/transport/i_transport.hpp"

#include <zmq.hpp>

#include <string>

namespace pulse {
namespace transport {

// -----------------------------------------------------------------------------
// ZmqTransport: ITransport over a ZeroMQ REQ/REP relay
// -----------------------------------------------------------------------------
//
// @brief  Sends each request as a JSON document to an HTTP relay process and
//         waits for its JSON reply.
//
// @details
// Wire format (one ZMQ message each way):
//
//   request  {"method":"GET","url":"https://<origin><path>?<query>",
//             "timeout_ms":310000,"endpoint":"subscribe"}
//   reply    {"status":200,"body":"<raw response body>"}
//            {"error":"<transport failure description>"}
//
// A fresh REQ socket is opened per request. A long-poll subscribe can sit
// outstanding for minutes while heartbeats go out in parallel, and a REQ
// socket only allows one request in flight, so sockets are not pooled.
// ZMQ_LINGER is 0 so an abandoned request never blocks socket close.
//
// Cancellation:
//   recv() runs with ZMQ_RCVTIMEO = kPollSliceMs. Between slices the token
//   and the request deadline are checked; the REQ socket is simply dropped
//   when either fires.
//
// Thread model:
//   execute() is safe to call concurrently; the zmq::context_t is
//   thread-safe and every call owns its socket.
//
// Ownership:
//   Owns the zmq::context_t. Must outlive every in-flight execute().
// -----------------------------------------------------------------------------
class ZmqTransport final : public ITransport {
 public:
  static constexpr int kPollSliceMs = 100;

  // -------------------------------------------------------------------------
  // @param  relay_endpoint  ZMQ endpoint of the relay, e.g.
  //                         "tcp://127.0.0.1:5560".
  // @param  origin          Scheme and host prepended to every request path,
  //                         e.g. "https://ps.pndsn.com".
  // -------------------------------------------------------------------------
  ZmqTransport(std::string relay_endpoint, std::string origin);

  ZmqTransport(const ZmqTransport&) = delete;
  ZmqTransport& operator=(const ZmqTransport&) = delete;

  TransportResult execute(const Request& request,
                          const CancellationToken& token) override;

  // Pure helpers, exposed for tests.
  static std::string encodeEnvelope(const Request& request,
                                    const std::string& origin);
  static TransportResult decodeReply(const std::string& reply);

 private:
  std::string relay_endpoint_;
  std::string origin_;
  zmq::context_t context_{1};
};

}  // namespace transport
}  // namespace pulse
