#pragma once

#include <string>
#include <utility>

namespace pulse {

// -----------------------------------------------------------------------------
// ErrorCategory: classification of every failure the engines can observe
// -----------------------------------------------------------------------------
//
// @brief  Decides how a failure is treated by the retry policy and whether
//         it is ever surfaced to the application.
//
// @details
//   Transport      Network failure or request timeout. Retried per policy.
//   Server         Non-2xx response or malformed body. Retried only for
//                  429 and 5xx.
//   Cancellation   The effect was cancelled. Never surfaced and never turned
//                  into a failure event.
//   Configuration  Invalid input detected before any request was made.
//                  Reported synchronously as ConfigurationError.
// -----------------------------------------------------------------------------
enum class ErrorCategory {
  Transport,
  Server,
  Cancellation,
  Configuration,
};

const char* toString(ErrorCategory category);

// -----------------------------------------------------------------------------
// EndpointError: value carried in failure events and statuses
// -----------------------------------------------------------------------------
struct EndpointError {
  ErrorCategory category{ErrorCategory::Transport};
  int status_code{0};  // HTTP status for Server errors, 0 otherwise
  std::string message;

  bool isCancellation() const {
    return category == ErrorCategory::Cancellation;
  }

  static EndpointError transport(std::string message) {
    return EndpointError{ErrorCategory::Transport, 0, std::move(message)};
  }

  static EndpointError server(int status_code, std::string message) {
    return EndpointError{ErrorCategory::Server, status_code,
                         std::move(message)};
  }

  static EndpointError cancelled() {
    return EndpointError{ErrorCategory::Cancellation, 0, "cancelled"};
  }
};

// "Server(503): Service Unavailable", "Transport: timed out", ...
std::string describe(const EndpointError& error);

}  // namespace pulse
