#include "pulse/subscribe/subscribe_engine.hpp"

#include "pulse/retry/retry_policy.hpp"
#include "pulse/subscribe/subscribe_transitions.hpp"

#include <iostream>
#include <sstream>

namespace pulse {
namespace subscribe {

namespace {

// "Handshaking --HandshakeSuccess--> Receiving [EmitStatus, ReceiveMessages]"
void logTransition(const State& from, const Event& event, const State& to,
                   const std::vector<Effect>& effects) {
  std::ostringstream line;
  line << "[SubscribeEngine] " << toString(from.kind) << " --"
       << eventName(event) << "--> " << toString(to.kind) << " [";
  for (std::size_t i = 0; i < effects.size(); ++i) {
    line << (i == 0 ? "" : ", ") << effectName(effects[i]);
  }
  line << "]\n";
  std::cout << line.str();
}

}  // namespace

SubscribeEngine::SubscribeEngine(const Configuration& config,
                                 transport::ITransport& transport,
                                 IExecutor& lane, IExecutor& io,
                                 ITimerService& timers, NotificationBus& bus)
    : handler_(config, transport, io, timers, bus),
      dispatcher_([this](const Effect& effect, const CancellationToken& token,
                         const EffectHandler::Emit& emit) {
        handler_(effect, token, emit);
      }),
      engine_(makeTransitions(
                  TransitionOptions{config.subscription_change_cursor},
                  std::make_shared<RetryPolicy>(config.retry)),
              dispatcher_, lane, State{StateKind::Unsubscribed, Context{}}) {
  if (config.log_transitions) {
    engine_.addTransitionListener(logTransition);
  }
}

}  // namespace subscribe
}  // namespace pulse
