#pragma once

#include "pulse/config/endpoint_kind.hpp"
#include "pulse/errors/endpoint_error.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace pulse {
namespace transport {

// -----------------------------------------------------------------------------
// Request: transport-neutral description of one REST call
// -----------------------------------------------------------------------------
//
// @brief  Built by the endpoint codec, executed by an ITransport.
//
// @details
// `path` segments and `query` values are already percent-encoded by the
// codec; url() only joins them. Query order is preserved so that requests
// are reproducible in tests.
// -----------------------------------------------------------------------------
struct Request {
  EndpointKind endpoint{EndpointKind::Subscribe};
  std::string method{"GET"};
  std::string path;
  std::vector<std::pair<std::string, std::string>> query;
  std::chrono::milliseconds timeout{15000};

  // path + "?" + k1=v1&k2=v2 (no "?" when query is empty)
  std::string url() const;

  // Value of the first query parameter named `key`, or "" when absent.
  std::string queryValue(const std::string& key) const;
  bool hasQuery(const std::string& key) const;
};

struct Response {
  int status{200};
  std::string body;
};

// A transport either produced a response (any HTTP status) or failed before
// one arrived (Transport or Cancellation error).
using TransportResult = std::variant<Response, EndpointError>;

}  // namespace transport
}  // namespace pulse
