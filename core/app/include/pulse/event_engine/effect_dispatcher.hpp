#pragma once

#include "pulse/concurrent/cancellation.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace pulse {
namespace event_engine {

// -----------------------------------------------------------------------------
// EffectDispatcher: runs effects and owns their cancellation handles
// -----------------------------------------------------------------------------
//
// @brief  Bridges transition output to asynchronous work (network calls,
//         timers) and guarantees that superseded work is cancelled.
//
// @details
// `Machine` additionally provides:
//   EffectChannel                                   exclusivity key enum
//   static std::optional<EffectChannel> channelOf(const Effect&)
//   static std::optional<EffectChannel> cancelTargetOf(const Effect&)
//
// dispatch(effect):
//   1. cancelTargetOf(effect) set   → cancel that channel, run nothing.
//   2. channelOf(effect) unset      → unmanaged: run the handler with a
//                                     token that is never cancelled.
//   3. otherwise                    → cancel the channel's current source,
//                                     install a fresh one, run the handler
//                                     with its token.
//
// The handler reports results through `emit`, which forwards the event
// together with the effect's token to the completion sink bound by the
// engine. The engine drops completions whose token was cancelled, so an
// effect that finishes after being superseded can never move the machine.
//
// Thread model:
//   dispatch(), cancel() and cancelAll() are called on the engine lane.
//   `emit` may be called from any thread (I/O worker, timer thread).
//   The source map is guarded by a mutex; sources are cancelled outside it
//   so abort callbacks may call back into the dispatcher.
//
// Ownership:
//   Owned by the engine wrapper. In-flight effects capture `this` through
//   `emit`; the owner stops the I/O pool and the timer service before
//   destroying the dispatcher.
// -----------------------------------------------------------------------------
template <typename Machine>
class EffectDispatcher {
 public:
  using Event = typename Machine::Event;
  using Effect = typename Machine::Effect;
  using EffectChannel = typename Machine::EffectChannel;

  using Emit = std::function<void(Event)>;
  using Handler = std::function<void(const Effect&, const CancellationToken&,
                                     const Emit&)>;
  using CompletionSink = std::function<void(const CancellationToken&, Event)>;

  explicit EffectDispatcher(Handler handler) : handler_(std::move(handler)) {}

  EffectDispatcher(const EffectDispatcher&) = delete;
  EffectDispatcher& operator=(const EffectDispatcher&) = delete;

  // Called once by the engine that consumes completion events.
  void bind(CompletionSink sink) {
    std::lock_guard lock(mutex_);
    sink_ = std::move(sink);
  }

  // -------------------------------------------------------------------------
  // dispatch(effect)
  // -------------------------------------------------------------------------
  void dispatch(const Effect& effect) {
    if (auto target = Machine::cancelTargetOf(effect)) {
      cancel(*target);
      return;
    }

    const auto channel = Machine::channelOf(effect);
    if (!channel) {
      const CancellationToken untracked{};
      handler_(effect, untracked, makeEmit(untracked));
      return;
    }

    CancellationSource source;
    std::optional<CancellationSource> previous;
    {
      std::lock_guard lock(mutex_);
      auto it = active_.find(*channel);
      if (it != active_.end()) {
        previous = it->second;
        it->second = source;
      } else {
        active_.emplace(*channel, source);
      }
    }

    if (previous) {
      previous->cancel();
    }

    const CancellationToken token = source.token();
    handler_(effect, token, makeEmit(token));
  }

  // Cancels the effect running on `channel`, if any.
  void cancel(EffectChannel channel) {
    std::optional<CancellationSource> source;
    {
      std::lock_guard lock(mutex_);
      auto it = active_.find(channel);
      if (it == active_.end()) {
        return;
      }
      source = it->second;
      active_.erase(it);
    }
    source->cancel();
  }

  // Cancels every managed effect. Used on shutdown.
  void cancelAll() {
    std::vector<CancellationSource> sources;
    {
      std::lock_guard lock(mutex_);
      for (auto& entry : active_) {
        sources.push_back(entry.second);
      }
      active_.clear();
    }
    for (auto& source : sources) {
      source.cancel();
    }
  }

  // True when the most recent effect on `channel` has not been cancelled.
  bool isActive(EffectChannel channel) const {
    std::lock_guard lock(mutex_);
    auto it = active_.find(channel);
    return it != active_.end() && !it->second.cancelled();
  }

 private:
  Emit makeEmit(const CancellationToken& token) {
    return [this, token](Event event) {
      CompletionSink sink;
      {
        std::lock_guard lock(mutex_);
        sink = sink_;
      }
      if (sink) {
        sink(token, std::move(event));
      }
    };
  }

  Handler handler_;

  mutable std::mutex mutex_;
  CompletionSink sink_;
  std::map<EffectChannel, CancellationSource> active_;
};

}  // namespace event_engine
}  // namespace pulse
