#pragma once

#include "pulse/concurrent/cancellation.hpp"
#include "pulse/transport/request.hpp"

namespace pulse {
namespace transport {

// -----------------------------------------------------------------------------
// ITransport: abstract request executor
// -----------------------------------------------------------------------------
//
// @brief  The only way the engines reach the network.
//
// @details
// Implementations:
//   - ZmqTransport       → forwards requests to an HTTP relay over ZeroMQ.
//   - ScriptedTransport  → test double with queued responses (tests/support).
//
// execute() blocks. It is called from I/O pool workers, never from an engine
// lane. It must honour `token` at best effort: once the token is cancelled
// it should return EndpointError::cancelled() as soon as it notices.
//
// Thread-safety contract:
//   execute() may be called concurrently from several workers.
// -----------------------------------------------------------------------------
class ITransport {
 public:
  virtual ~ITransport() = default;

  virtual TransportResult execute(const Request& request,
                                  const CancellationToken& token) = 0;
};

}  // namespace transport
}  // namespace pulse
