#pragma once

#include "pulse/config/endpoint_kind.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace pulse {

enum class RetryPolicyKind {
  None,
  Linear,
  Exponential,
};

// What a non-empty SubscriptionChange does with the current cursor.
enum class CursorPolicy {
  Preserve,  // keep it; newly added channels catch up from there
  Reset,     // drop it; the next handshake starts from "now"
};

const char* toString(RetryPolicyKind kind);
const char* toString(CursorPolicy policy);

// -----------------------------------------------------------------------------
// RetryConfiguration: parameters of the retry/backoff policy
// -----------------------------------------------------------------------------
//
// @brief  Selects the policy and its limits. Turned into a RetryPolicy by
//         each engine at construction.
//
// @details
// Limits enforced by validate():
//   Linear       delay >= 2 s, maximum_retry <= 10
//   Exponential  minimum_delay >= 2 s, maximum_delay <= 150 s,
//                minimum_delay <= maximum_delay, maximum_retry <= 6
//
// The named constructors fill in the documented defaults for each policy.
// -----------------------------------------------------------------------------
struct RetryConfiguration {
  static constexpr std::chrono::seconds kMinimumDelay{2};
  static constexpr std::chrono::seconds kMaximumDelay{150};
  static constexpr int kLinearMaximumRetry = 10;
  static constexpr int kExponentialMaximumRetry = 6;

  RetryPolicyKind policy{RetryPolicyKind::Exponential};
  std::chrono::seconds delay{2};            // linear
  std::chrono::seconds minimum_delay{2};    // exponential
  std::chrono::seconds maximum_delay{150};  // exponential
  int maximum_retry{kExponentialMaximumRetry};
  std::chrono::milliseconds maximum_jitter{1000};
  std::vector<EndpointKind> excluded_endpoints;

  static RetryConfiguration none();
  static RetryConfiguration linear(std::chrono::seconds delay,
                                   int maximum_retry = kLinearMaximumRetry);
  static RetryConfiguration exponential(
      std::chrono::seconds minimum_delay, std::chrono::seconds maximum_delay,
      int maximum_retry = kExponentialMaximumRetry);

  bool isExcluded(EndpointKind kind) const;

  // Throws ConfigurationError when a limit above is violated.
  void validate() const;
};

// -----------------------------------------------------------------------------
// Configuration: every tunable of the realtime core
// -----------------------------------------------------------------------------
//
// @brief  Plain struct with defaults, passed by const reference into the
//         client and both engines. There is no process-wide configuration.
//
// @details
// Loaded from JSON by configurationFromJson()/loadConfiguration(); keys match
// the member names (retry settings live in a nested "retry" object, delays
// carry an "_s" or "_ms" suffix).
//
// presence_timeout and heartbeat_interval are coupled: setting the presence
// timeout through setPresenceTimeout() derives the interval as
// timeout/2 - 1, matching the server's expectation that at least two
// heartbeats arrive inside one timeout window. A heartbeat_interval of zero
// disables the presence engine.
// -----------------------------------------------------------------------------
struct Configuration {
  static constexpr std::chrono::seconds kDefaultPresenceTimeout{300};
  static constexpr std::chrono::seconds kMinimumPresenceTimeout{20};
  static constexpr std::chrono::seconds kMaximumPresenceTimeout{320};

  std::string subscribe_key;
  std::string user_id;
  std::string filter_expression;

  std::chrono::seconds subscribe_request_timeout{310};
  std::chrono::seconds transactional_request_timeout{15};
  std::chrono::seconds presence_timeout{kDefaultPresenceTimeout};
  std::chrono::seconds heartbeat_interval{0};

  bool suppress_leave_events{false};
  bool announce_successful_heartbeats{false};
  bool announce_failed_heartbeats{true};

  bool dedupe_on_subscribe{false};
  std::size_t maximum_cache_size{100};

  CursorPolicy subscription_change_cursor{CursorPolicy::Preserve};
  bool presence_follow_subscription{true};

  RetryConfiguration retry;

  std::size_t io_threads{4};
  bool log_transitions{false};

  // -------------------------------------------------------------------------
  // setPresenceTimeout(timeout)
  // -------------------------------------------------------------------------
  // Values outside [20 s, 320 s] are clamped (warning on std::cerr). Zero or
  // negative values are ignored with a warning and the default stays. On
  // success the heartbeat interval is derived as timeout/2 - 1, which is at
  // least 9 s.
  // -------------------------------------------------------------------------
  void setPresenceTimeout(std::chrono::seconds timeout);

  bool presenceEnabled() const { return heartbeat_interval.count() > 0; }

  // Throws ConfigurationError for missing keys and out-of-range values.
  void validate() const;
};

// Throws ConfigurationError on malformed input or a failed validate().
Configuration configurationFromJson(const nlohmann::json& json);
Configuration loadConfiguration(const std::string& path);

}  // namespace pulse
