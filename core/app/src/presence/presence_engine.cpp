#include "pulse/presence/presence_engine.hpp"

#include "pulse/presence/presence_transitions.hpp"
#include "pulse/retry/retry_policy.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

namespace pulse {
namespace presence {

namespace {

TransitionOptions optionsFrom(const Configuration& config) {
  TransitionOptions options;
  options.heartbeat_interval =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          config.heartbeat_interval);
  options.suppress_leave_events = config.suppress_leave_events;
  options.announce_successful_heartbeats =
      config.announce_successful_heartbeats;
  options.announce_failed_heartbeats = config.announce_failed_heartbeats;
  return options;
}

void logTransition(const State& from, const Event& event, const State& to,
                   const std::vector<Effect>& effects) {
  std::ostringstream line;
  line << "[PresenceEngine] " << toString(from.kind) << " --"
       << eventName(event) << "--> " << toString(to.kind) << " [";
  for (std::size_t i = 0; i < effects.size(); ++i) {
    line << (i == 0 ? "" : ", ") << effectName(effects[i]);
  }
  line << "]\n";
  std::cout << line.str();
}

}  // namespace

PresenceEngine::PresenceEngine(const Configuration& config,
                               transport::ITransport& transport,
                               IExecutor& lane, IExecutor& io,
                               ITimerService& timers, NotificationBus& bus)
    : handler_(config, transport, io, timers, bus),
      dispatcher_([this](const Effect& effect, const CancellationToken& token,
                         const EffectHandler::Emit& emit) {
        handler_(effect, token, emit);
      }),
      engine_(makeTransitions(optionsFrom(config),
                              std::make_shared<RetryPolicy>(config.retry)),
              dispatcher_, lane,
              State{StateKind::HeartbeatInactive, Context{}}) {
  if (config.log_transitions) {
    engine_.addTransitionListener(logTransition);
  }
}

}  // namespace presence
}  // namespace pulse
