#include "pulse/presence/presence_effect_handler.hpp"

#include "pulse/api/presence_endpoint.hpp"

#include <iostream>
#include <optional>
#include <utility>

namespace pulse {
namespace presence {

EffectHandler::EffectHandler(const Configuration& config,
                             transport::ITransport& transport, IExecutor& io,
                             ITimerService& timers, NotificationBus& bus)
    : config_(config),
      transport_(transport),
      io_(io),
      timers_(timers),
      bus_(bus) {}

void EffectHandler::operator()(const Effect& effect,
                               const CancellationToken& token,
                               const Emit& emit) {
  if (const auto* e = std::get_if<effect::Heartbeat>(&effect)) {
    heartbeat(*e, token, emit);
  } else if (const auto* e = std::get_if<effect::Leave>(&effect)) {
    leave(*e);
  } else if (const auto* e = std::get_if<effect::Wait>(&effect)) {
    wait(*e, token, emit);
  } else if (const auto* e =
                 std::get_if<effect::EmitHeartbeatStatus>(&effect)) {
    bus_.publish(e->status);
  }
}

// -----------------------------------------------------------------------------
// heartbeat()
// -----------------------------------------------------------------------------
void EffectHandler::heartbeat(const effect::Heartbeat& heartbeat,
                              const CancellationToken& token,
                              const Emit& emit) {
  auto request = api::makeHeartbeatRequest(
      config_, heartbeat.channels.withoutPresenceChannels(), heartbeat.groups);

  io_.post([this, request = std::move(request), token, emit] {
    if (token.cancelled()) {
      return;
    }

    auto result = transport_.execute(request, token);
    if (token.cancelled()) {
      return;
    }

    std::optional<EndpointError> error;
    if (const auto* failure = std::get_if<EndpointError>(&result)) {
      if (failure->isCancellation()) {
        return;
      }
      error = *failure;
    } else {
      error = api::parsePresenceResponse(std::get<transport::Response>(result));
    }

    if (error) {
      std::cerr << "[PresenceEngine] heartbeat failed: " << describe(*error)
                << "\n";
      emit(event::HeartbeatFailure{*error});
    } else {
      emit(event::HeartbeatSuccess{});
    }
  });
}

// -----------------------------------------------------------------------------
// leave()
// -----------------------------------------------------------------------------
// Unmanaged: runs to completion even when the presence engine moves on, and
// never produces an event.
// -----------------------------------------------------------------------------
void EffectHandler::leave(const effect::Leave& leave) {
  auto request = api::makeLeaveRequest(
      config_, leave.channels.withoutPresenceChannels(), leave.groups);

  io_.post([this, request = std::move(request)] {
    auto result = transport_.execute(request, CancellationToken{});

    std::optional<EndpointError> error;
    if (const auto* failure = std::get_if<EndpointError>(&result)) {
      error = *failure;
    } else {
      error = api::parsePresenceResponse(std::get<transport::Response>(result));
    }

    if (error) {
      std::cerr << "[PresenceEngine] leave failed: " << describe(*error)
                << "\n";
    }
  });
}

// -----------------------------------------------------------------------------
// wait()
// -----------------------------------------------------------------------------
void EffectHandler::wait(const effect::Wait& wait,
                         const CancellationToken& token, const Emit& emit) {
  const WaitReason reason = wait.reason;
  const TimerId id = timers_.schedule(wait.delay, [emit, reason] {
    if (reason == WaitReason::Cooldown) {
      emit(event::TimesUp{});
    } else {
      emit(event::Retry{});
    }
  });
  token.onCancel([this, id] { timers_.cancel(id); });
}

}  // namespace presence
}  // namespace pulse
