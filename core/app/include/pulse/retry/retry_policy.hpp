#pragma once

#include "pulse/config/configuration.hpp"
#include "pulse/config/endpoint_kind.hpp"
#include "pulse/errors/endpoint_error.hpp"

#include <chrono>
#include <cstdint>
#include <random>

namespace pulse {

// Outcome of RetryPolicy::shouldRetry(). `delay` is meaningful only when
// `retry` is true.
struct RetryDecision {
  bool retry{false};
  std::chrono::milliseconds delay{0};
};

// -----------------------------------------------------------------------------
// RetryPolicy: decides whether and when a failed request is re-issued
// -----------------------------------------------------------------------------
//
// @brief  Pure decision function over (attempt, endpoint, error) plus a
//         jitter source.
//
// @details
// `attempt` counts the retries already made in the current failure streak;
// it is 0 on the first failure.
//
// Retry is refused when:
//   - the policy is None,
//   - the endpoint kind is excluded,
//   - the error is a cancellation or configuration error,
//   - the error is a server error other than 429 or 5xx,
//   - attempt >= maximum_retry.
//
// Delay before jitter:
//   Linear       constant `delay`
//   Exponential  min(maximum_delay, minimum_delay * 2^attempt)
//
// Uniform jitter in [0, maximum_jitter] is added on top.
//
// Thread model:
//   Owned by one engine, used only on its lane. The random engine is not
//   shared.
// -----------------------------------------------------------------------------
class RetryPolicy {
 public:
  // Validates `config`; throws ConfigurationError on invalid limits.
  explicit RetryPolicy(RetryConfiguration config,
                       std::uint32_t seed = std::random_device{}());

  RetryDecision shouldRetry(int attempt, EndpointKind endpoint,
                            const EndpointError& error);

  // Delay for `attempt` without jitter. Exposed for tests and logging.
  std::chrono::milliseconds baseDelay(int attempt) const;

  // True when `error` is of a kind that may ever be retried.
  static bool isRetryable(const EndpointError& error);

  const RetryConfiguration& configuration() const { return config_; }

 private:
  std::chrono::milliseconds jitter();

  RetryConfiguration config_;
  std::mt19937 random_;
};

}  // namespace pulse
