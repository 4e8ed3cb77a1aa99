#include "pulse/retry/retry_policy.hpp"

#include <algorithm>
#include <utility>

namespace pulse {

RetryPolicy::RetryPolicy(RetryConfiguration config, std::uint32_t seed)
    : config_(std::move(config)), random_(seed) {
  config_.validate();
}

// -----------------------------------------------------------------------------
// isRetryable()
// -----------------------------------------------------------------------------
bool RetryPolicy::isRetryable(const EndpointError& error) {
  switch (error.category) {
    case ErrorCategory::Transport:
      return true;
    case ErrorCategory::Server:
      return error.status_code == 429 ||
             (error.status_code >= 500 && error.status_code <= 599);
    case ErrorCategory::Cancellation:
    case ErrorCategory::Configuration:
      return false;
  }
  return false;
}

// -----------------------------------------------------------------------------
// shouldRetry()
// -----------------------------------------------------------------------------
RetryDecision RetryPolicy::shouldRetry(int attempt, EndpointKind endpoint,
                                       const EndpointError& error) {
  if (config_.policy == RetryPolicyKind::None ||
      config_.isExcluded(endpoint) || !isRetryable(error) ||
      attempt >= config_.maximum_retry) {
    return RetryDecision{};
  }

  return RetryDecision{true, baseDelay(attempt) + jitter()};
}

// -----------------------------------------------------------------------------
// baseDelay()
// -----------------------------------------------------------------------------
// The exponential branch doubles step by step and stops at maximum_delay so
// that a large attempt never overflows the shift.
// -----------------------------------------------------------------------------
std::chrono::milliseconds RetryPolicy::baseDelay(int attempt) const {
  using std::chrono::milliseconds;

  switch (config_.policy) {
    case RetryPolicyKind::None:
      return milliseconds(0);

    case RetryPolicyKind::Linear:
      return std::chrono::duration_cast<milliseconds>(config_.delay);

    case RetryPolicyKind::Exponential: {
      const auto cap =
          std::chrono::duration_cast<milliseconds>(config_.maximum_delay);
      auto delay =
          std::chrono::duration_cast<milliseconds>(config_.minimum_delay);
      for (int i = 0; i < attempt && delay < cap; ++i) {
        delay *= 2;
      }
      return std::min(delay, cap);
    }
  }
  return milliseconds(0);
}

std::chrono::milliseconds RetryPolicy::jitter() {
  if (config_.maximum_jitter.count() <= 0) {
    return std::chrono::milliseconds(0);
  }
  std::uniform_int_distribution<long long> dist(
      0, config_.maximum_jitter.count());
  return std::chrono::milliseconds(dist(random_));
}

}  // namespace pulse
