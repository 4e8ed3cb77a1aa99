#include "pulse/concurrent/cancellation.hpp"

#include <utility>

namespace pulse {

// -----------------------------------------------------------------------------
// CancellationToken
// -----------------------------------------------------------------------------
bool CancellationToken::cancelled() const {
  if (!state_) {
    return false;
  }
  std::lock_guard lock(state_->mutex);
  return state_->cancelled;
}

void CancellationToken::onCancel(std::function<void()> callback) const {
  if (!state_ || !callback) {
    return;
  }

  {
    std::lock_guard lock(state_->mutex);
    if (!state_->cancelled) {
      state_->callbacks.push_back(std::move(callback));
      return;
    }
  }

  // Already cancelled: run now, without the lock.
  callback();
}

// -----------------------------------------------------------------------------
// CancellationSource
// -----------------------------------------------------------------------------
CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

void CancellationSource::cancel() {
  std::vector<std::function<void()>> callbacks;

  {
    std::lock_guard lock(state_->mutex);
    if (state_->cancelled) {
      return;
    }
    state_->cancelled = true;
    callbacks.swap(state_->callbacks);
  }

  for (auto& callback : callbacks) {
    callback();
  }
}

bool CancellationSource::cancelled() const {
  std::lock_guard lock(state_->mutex);
  return state_->cancelled;
}

}  // namespace pulse
