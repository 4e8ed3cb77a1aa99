#include "pulse/config/configuration.hpp"

#include "pulse/errors/configuration_error.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace pulse {

namespace {

bool isBlank(const std::string& text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
}

RetryPolicyKind retryPolicyFromString(const std::string& text) {
  if (text == "none") return RetryPolicyKind::None;
  if (text == "linear") return RetryPolicyKind::Linear;
  if (text == "exponential") return RetryPolicyKind::Exponential;
  throw ConfigurationError("retry.policy: unknown policy '" + text + "'");
}

CursorPolicy cursorPolicyFromString(const std::string& text) {
  if (text == "preserve") return CursorPolicy::Preserve;
  if (text == "reset") return CursorPolicy::Reset;
  throw ConfigurationError("subscription_change_cursor: unknown policy '" +
                           text + "'");
}

// -----------------------------------------------------------------------------
// retryFromJson(): nested "retry" object
// -----------------------------------------------------------------------------
// The policy is read first so that the per-policy defaults (maximum_retry in
// particular) apply before any explicit override.
// -----------------------------------------------------------------------------
RetryConfiguration retryFromJson(const nlohmann::json& j) {
  const auto kind =
      retryPolicyFromString(j.value("policy", std::string("exponential")));

  RetryConfiguration retry;
  switch (kind) {
    case RetryPolicyKind::None:
      retry = RetryConfiguration::none();
      break;
    case RetryPolicyKind::Linear:
      retry = RetryConfiguration::linear(
          std::chrono::seconds(j.value("delay_s", 2)));
      break;
    case RetryPolicyKind::Exponential:
      retry = RetryConfiguration::exponential(
          std::chrono::seconds(j.value("minimum_delay_s", 2)),
          std::chrono::seconds(j.value("maximum_delay_s", 150)));
      break;
  }

  if (j.contains("maximum_retry")) {
    retry.maximum_retry = j.at("maximum_retry").get<int>();
  }
  if (j.contains("maximum_jitter_ms")) {
    retry.maximum_jitter =
        std::chrono::milliseconds(j.at("maximum_jitter_ms").get<int>());
  }
  if (j.contains("excluded_endpoints")) {
    for (const auto& item : j.at("excluded_endpoints")) {
      const auto name = item.get<std::string>();
      const auto kind_opt = endpointKindFromString(name);
      if (!kind_opt) {
        throw ConfigurationError(
            "retry.excluded_endpoints: unknown endpoint '" + name + "'");
      }
      retry.excluded_endpoints.push_back(*kind_opt);
    }
  }
  return retry;
}

}  // namespace

const char* toString(RetryPolicyKind kind) {
  switch (kind) {
    case RetryPolicyKind::None:        return "none";
    case RetryPolicyKind::Linear:      return "linear";
    case RetryPolicyKind::Exponential: return "exponential";
  }
  return "unknown";
}

const char* toString(CursorPolicy policy) {
  return policy == CursorPolicy::Preserve ? "preserve" : "reset";
}

// -----------------------------------------------------------------------------
// RetryConfiguration
// -----------------------------------------------------------------------------
RetryConfiguration RetryConfiguration::none() {
  RetryConfiguration retry;
  retry.policy = RetryPolicyKind::None;
  retry.maximum_retry = 0;
  return retry;
}

RetryConfiguration RetryConfiguration::linear(std::chrono::seconds delay,
                                              int maximum_retry) {
  RetryConfiguration retry;
  retry.policy = RetryPolicyKind::Linear;
  retry.delay = delay;
  retry.maximum_retry = maximum_retry;
  return retry;
}

RetryConfiguration RetryConfiguration::exponential(
    std::chrono::seconds minimum_delay, std::chrono::seconds maximum_delay,
    int maximum_retry) {
  RetryConfiguration retry;
  retry.policy = RetryPolicyKind::Exponential;
  retry.minimum_delay = minimum_delay;
  retry.maximum_delay = maximum_delay;
  retry.maximum_retry = maximum_retry;
  return retry;
}

bool RetryConfiguration::isExcluded(EndpointKind kind) const {
  return std::find(excluded_endpoints.begin(), excluded_endpoints.end(),
                   kind) != excluded_endpoints.end();
}

void RetryConfiguration::validate() const {
  if (maximum_retry < 0) {
    throw ConfigurationError("retry.maximum_retry must not be negative");
  }
  if (maximum_jitter.count() < 0) {
    throw ConfigurationError("retry.maximum_jitter_ms must not be negative");
  }

  switch (policy) {
    case RetryPolicyKind::None:
      return;

    case RetryPolicyKind::Linear:
      if (delay < kMinimumDelay) {
        throw ConfigurationError(
            "retry.delay_s can not be set less than 2 seconds");
      }
      if (maximum_retry > kLinearMaximumRetry) {
        throw ConfigurationError(
            "retry.maximum_retry can not be more than 10 for linear policy");
      }
      return;

    case RetryPolicyKind::Exponential:
      if (minimum_delay < kMinimumDelay) {
        throw ConfigurationError(
            "retry.minimum_delay_s can not be set less than 2 seconds");
      }
      if (maximum_delay > kMaximumDelay) {
        throw ConfigurationError(
            "retry.maximum_delay_s can not be set more than 150 seconds");
      }
      if (minimum_delay > maximum_delay) {
        throw ConfigurationError(
            "retry.minimum_delay_s can not exceed retry.maximum_delay_s");
      }
      if (maximum_retry > kExponentialMaximumRetry) {
        throw ConfigurationError(
            "retry.maximum_retry can not be more than 6 for exponential "
            "policy");
      }
      return;
  }
}

// -----------------------------------------------------------------------------
// Configuration
// -----------------------------------------------------------------------------
void Configuration::setPresenceTimeout(std::chrono::seconds timeout) {
  if (timeout.count() <= 0) {
    std::cerr << "[Configuration] presence_timeout_s must be positive; "
                 "keeping "
              << presence_timeout.count() << "s\n";
    return;
  }

  if (timeout > kMaximumPresenceTimeout) {
    std::cerr << "[Configuration] presence_timeout_s " << timeout.count()
              << " exceeds maximum; clamped to "
              << kMaximumPresenceTimeout.count() << "s\n";
    timeout = kMaximumPresenceTimeout;
  } else if (timeout < kMinimumPresenceTimeout) {
    std::cerr << "[Configuration] presence_timeout_s " << timeout.count()
              << " is below minimum; raised to "
              << kMinimumPresenceTimeout.count() << "s\n";
    timeout = kMinimumPresenceTimeout;
  }

  presence_timeout = timeout;
  heartbeat_interval = timeout / 2 - std::chrono::seconds(1);
}

void Configuration::validate() const {
  if (subscribe_key.empty()) {
    throw ConfigurationError("subscribe_key is required");
  }
  if (user_id.empty() || isBlank(user_id)) {
    throw ConfigurationError("user_id is required and must not be blank");
  }
  if (subscribe_request_timeout.count() <= 0) {
    throw ConfigurationError("subscribe_request_timeout_s must be positive");
  }
  if (transactional_request_timeout.count() <= 0) {
    throw ConfigurationError(
        "transactional_request_timeout_s must be positive");
  }
  if (heartbeat_interval.count() < 0) {
    throw ConfigurationError("heartbeat_interval_s must not be negative");
  }
  if (maximum_cache_size == 0) {
    throw ConfigurationError("maximum_cache_size must be greater than zero");
  }
  if (io_threads == 0) {
    throw ConfigurationError("io_threads must be greater than zero");
  }
  retry.validate();
}

// -----------------------------------------------------------------------------
// configurationFromJson()
// -----------------------------------------------------------------------------
// Unknown keys are ignored. Type mismatches surface as
// nlohmann::json::exception and are reported as ConfigurationError.
// -----------------------------------------------------------------------------
Configuration configurationFromJson(const nlohmann::json& j) {
  Configuration config;

  try {
    if (!j.is_object()) {
      throw ConfigurationError("configuration root must be a JSON object");
    }

    config.subscribe_key = j.value("subscribe_key", std::string());
    config.user_id = j.value("user_id", std::string());
    config.filter_expression = j.value("filter_expression", std::string());

    config.subscribe_request_timeout =
        std::chrono::seconds(j.value("subscribe_request_timeout_s", 310));
    config.transactional_request_timeout =
        std::chrono::seconds(j.value("transactional_request_timeout_s", 15));

    if (j.contains("presence_timeout_s")) {
      config.setPresenceTimeout(
          std::chrono::seconds(j.at("presence_timeout_s").get<int>()));
    }
    if (j.contains("heartbeat_interval_s")) {
      config.heartbeat_interval =
          std::chrono::seconds(j.at("heartbeat_interval_s").get<int>());
    }

    config.suppress_leave_events = j.value("suppress_leave_events", false);
    config.announce_successful_heartbeats =
        j.value("announce_successful_heartbeats", false);
    config.announce_failed_heartbeats =
        j.value("announce_failed_heartbeats", true);

    config.dedupe_on_subscribe = j.value("dedupe_on_subscribe", false);
    config.maximum_cache_size =
        j.value("maximum_cache_size", static_cast<std::size_t>(100));

    config.subscription_change_cursor = cursorPolicyFromString(
        j.value("subscription_change_cursor", std::string("preserve")));
    config.presence_follow_subscription =
        j.value("presence_follow_subscription", true);

    if (j.contains("retry")) {
      config.retry = retryFromJson(j.at("retry"));
    }

    config.io_threads = j.value("io_threads", static_cast<std::size_t>(4));
    config.log_transitions = j.value("log_transitions", false);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigurationError(std::string("invalid configuration: ") +
                             e.what());
  }

  config.validate();
  return config;
}

// -----------------------------------------------------------------------------
// loadConfiguration()
// -----------------------------------------------------------------------------
Configuration loadConfiguration(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigurationError("cannot open configuration file: " + path);
  }

  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigurationError("configuration file " + path +
                             " is not valid JSON: " + e.what());
  }

  std::cout << "[Configuration] loaded " << path << "\n";
  return configurationFromJson(j);
}

}  // namespace pulse
