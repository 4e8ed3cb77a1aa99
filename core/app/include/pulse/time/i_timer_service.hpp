#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace pulse {

// Opaque handle returned by ITimerService::schedule(). 0 is never issued.
using TimerId = std::uint64_t;

// -----------------------------------------------------------------------------
// ITimerService: abstract one-shot timer source
// -----------------------------------------------------------------------------
//
// @brief  Runs a callback after a delay, cancellable until it fires.
//
// @details
// `wait` effects (retry backoff, heartbeat cooldown) are built on this
// interface instead of sleeping on a thread:
//   - LiveTimerService     → one background thread, steady_clock deadlines.
//   - ManualTimerService   → test double; time advances only when the test
//                            says so (tests/support).
//
// The callback runs on the timer's own thread. Effect handlers only use it
// to post a completion event back to their engine lane, never to touch
// engine state directly.
//
// Thread-safety contract:
//   schedule() and cancel() must be callable from any thread, including
//   from inside a running callback.
//
// Ownership:
//   Engines hold a reference; RealtimeClient owns the live instance and
//   stops it before destroying the engines.
// -----------------------------------------------------------------------------
class ITimerService {
 public:
  virtual ~ITimerService() = default;

  // -------------------------------------------------------------------------
  // schedule(delay, callback)
  // -------------------------------------------------------------------------
  // @brief  Arms a one-shot timer.
  //
  // @param  delay     Time until the callback should run. Zero or negative
  //                   means "as soon as possible".
  // @param  callback  Invoked once, on the timer thread, unless cancelled.
  //
  // @return TimerId to pass to cancel().
  // -------------------------------------------------------------------------
  virtual TimerId schedule(std::chrono::milliseconds delay,
                           std::function<void()> callback) = 0;

  // -------------------------------------------------------------------------
  // cancel(id)
  // -------------------------------------------------------------------------
  // @brief  Disarms a timer. Unknown or already-fired ids are ignored.
  //
  // @details
  // A callback that has already been taken off the schedule may still be
  // running when cancel() returns. Callers that must never observe a late
  // fire pair the timer with a CancellationToken check on the receiving side.
  // -------------------------------------------------------------------------
  virtual void cancel(TimerId id) = 0;
};

}  // namespace pulse
