#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace pulse {

namespace detail {

// Shared between one CancellationSource and all tokens handed out by it.
struct CancellationState {
  std::mutex mutex;
  bool cancelled{false};
  std::vector<std::function<void()>> callbacks;
};

}  // namespace detail

// -----------------------------------------------------------------------------
// CancellationToken: read side of a cancellation handle
// -----------------------------------------------------------------------------
//
// @brief  Lets an in-flight effect observe that it was cancelled and
//         register abort actions (drop a timer, abort a socket wait).
//
// @details
// A default-constructed token is never cancelled. It is what unmanaged
// effects (status emission, leave requests) receive.
//
// Tokens are cheap to copy; every copy observes the same source.
//
// Thread-safety: cancelled() and onCancel() may be called from any thread.
// -----------------------------------------------------------------------------
class CancellationToken {
 public:
  CancellationToken() = default;

  bool cancelled() const;

  // -------------------------------------------------------------------------
  // onCancel(callback)
  // -------------------------------------------------------------------------
  // Registers `callback` to run once when the source is cancelled. If the
  // source is already cancelled the callback runs immediately on the caller's
  // thread. Callbacks must not block; they run on whichever thread calls
  // CancellationSource::cancel() (normally an engine lane).
  // -------------------------------------------------------------------------
  void onCancel(std::function<void()> callback) const;

 private:
  friend class CancellationSource;

  explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::CancellationState> state_;
};

// -----------------------------------------------------------------------------
// CancellationSource: write side, owned by the EffectDispatcher
// -----------------------------------------------------------------------------
//
// @brief  Creates tokens and cancels them.
//
// @details
// The dispatcher keeps exactly one source per effect channel. Starting a
// replacement effect on that channel cancels the old source first. Copies
// of a source share state, so the dispatcher can move a source out of its
// map under a lock and cancel it after the lock is released.
// -----------------------------------------------------------------------------
class CancellationSource {
 public:
  CancellationSource();

  CancellationToken token() const { return CancellationToken(state_); }

  // Marks the source cancelled and runs registered callbacks once, outside
  // the internal lock. Further calls are no-ops.
  void cancel();

  bool cancelled() const;

 private:
  std::shared_ptr<detail::CancellationState> state_;
};

}  // namespace pulse
