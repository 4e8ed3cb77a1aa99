#include "pulse/subscribe/subscribe_effect_handler.hpp"

#include "pulse/api/subscribe_endpoint.hpp"

#include <iostream>
#include <utility>

namespace pulse {
namespace subscribe {

EffectHandler::EffectHandler(const Configuration& config,
                             transport::ITransport& transport, IExecutor& io,
                             ITimerService& timers, NotificationBus& bus)
    : config_(config),
      transport_(transport),
      io_(io),
      timers_(timers),
      bus_(bus) {
  if (config_.dedupe_on_subscribe) {
    dedup_.emplace(config_.maximum_cache_size);
  }
}

// -----------------------------------------------------------------------------
// operator(): effect dispatch
// -----------------------------------------------------------------------------
void EffectHandler::operator()(const Effect& effect,
                               const CancellationToken& token,
                               const Emit& emit) {
  if (const auto* e = std::get_if<effect::Handshake>(&effect)) {
    handshake(e->channels, e->groups, token, emit);
    return;
  }
  if (const auto* e = std::get_if<effect::HandshakeReconnect>(&effect)) {
    handshake(e->channels, e->groups, token, emit);
    return;
  }
  if (const auto* e = std::get_if<effect::ReceiveMessages>(&effect)) {
    receive(e->channels, e->groups, e->cursor, token, emit);
    return;
  }
  if (const auto* e = std::get_if<effect::ReceiveReconnect>(&effect)) {
    receive(e->channels, e->groups, e->cursor, token, emit);
    return;
  }
  if (const auto* e = std::get_if<effect::Wait>(&effect)) {
    wait(*e, token, emit);
    return;
  }
  if (const auto* e = std::get_if<effect::EmitMessages>(&effect)) {
    emitMessages(*e);
    return;
  }
  if (const auto* e = std::get_if<effect::EmitStatus>(&effect)) {
    bus_.publish(e->status);
    return;
  }
  // CancelPrevious is consumed by the dispatcher.
}

// -----------------------------------------------------------------------------
// handshake()
// -----------------------------------------------------------------------------
void EffectHandler::handshake(const domain::ChannelSet& channels,
                              const domain::ChannelSet& groups,
                              const CancellationToken& token,
                              const Emit& emit) {
  auto request = api::makeHandshakeRequest(config_, channels, groups);

  io_.post([this, request = std::move(request), token, emit] {
    if (token.cancelled()) {
      return;
    }

    auto result = transport_.execute(request, token);
    if (token.cancelled()) {
      return;
    }

    if (const auto* error = std::get_if<EndpointError>(&result)) {
      if (error->isCancellation()) {
        return;
      }
      std::cerr << "[SubscribeEngine] handshake failed: " << describe(*error)
                << "\n";
      emit(event::HandshakeFailure{*error});
      return;
    }

    auto outcome =
        api::parseSubscribeResponse(std::get<transport::Response>(result));
    if (auto* parsed = std::get_if<api::SubscribeResult>(&outcome)) {
      emit(event::HandshakeSuccess{parsed->cursor});
    } else {
      const auto& error = std::get<EndpointError>(outcome);
      std::cerr << "[SubscribeEngine] handshake failed: " << describe(error)
                << "\n";
      emit(event::HandshakeFailure{error});
    }
  });
}

// -----------------------------------------------------------------------------
// receive()
// -----------------------------------------------------------------------------
void EffectHandler::receive(const domain::ChannelSet& channels,
                            const domain::ChannelSet& groups,
                            const domain::Cursor& cursor,
                            const CancellationToken& token, const Emit& emit) {
  auto request = api::makeReceiveRequest(config_, channels, groups, cursor);

  io_.post([this, request = std::move(request), token, emit] {
    if (token.cancelled()) {
      return;
    }

    auto result = transport_.execute(request, token);
    if (token.cancelled()) {
      return;
    }

    if (const auto* error = std::get_if<EndpointError>(&result)) {
      if (error->isCancellation()) {
        return;
      }
      std::cerr << "[SubscribeEngine] receive failed: " << describe(*error)
                << "\n";
      emit(event::ReceiveFailure{*error});
      return;
    }

    auto outcome =
        api::parseSubscribeResponse(std::get<transport::Response>(result));
    if (auto* parsed = std::get_if<api::SubscribeResult>(&outcome)) {
      emit(event::ReceiveSuccess{parsed->cursor, std::move(parsed->messages)});
    } else {
      const auto& error = std::get<EndpointError>(outcome);
      std::cerr << "[SubscribeEngine] receive failed: " << describe(error)
                << "\n";
      emit(event::ReceiveFailure{error});
    }
  });
}

// -----------------------------------------------------------------------------
// wait()
// -----------------------------------------------------------------------------
// The timer is disarmed when the token is cancelled. If the timer has
// already fired, the engine drops the Retry because its token is cancelled.
// -----------------------------------------------------------------------------
void EffectHandler::wait(const effect::Wait& wait,
                         const CancellationToken& token, const Emit& emit) {
  const TimerId id =
      timers_.schedule(wait.delay, [emit] { emit(event::Retry{}); });
  token.onCancel([this, id] { timers_.cancel(id); });
}

// -----------------------------------------------------------------------------
// emitMessages()
// -----------------------------------------------------------------------------
void EffectHandler::emitMessages(const effect::EmitMessages& effect) {
  for (const auto& message : effect.messages) {
    if (dedup_ && !dedup_->shouldDeliver(message)) {
      continue;
    }
    bus_.publish(message);
  }
}

}  // namespace subscribe
}  // namespace pulse
