#include "pulse/time/live_timer_service.hpp"

#include <exception>
#include <iostream>
#include <utility>
#include <vector>

namespace pulse {

LiveTimerService::~LiveTimerService() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void LiveTimerService::start() {
  std::lock_guard lock(mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void LiveTimerService::stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
    timers_.clear();
  }

  wakeup_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

// -----------------------------------------------------------------------------
// schedule()
// -----------------------------------------------------------------------------
TimerId LiveTimerService::schedule(std::chrono::milliseconds delay,
                                   std::function<void()> callback) {
  TimerId id = 0;
  {
    std::lock_guard lock(mutex_);
    id = next_id_++;
    timers_.emplace(id, Entry{Clock::now() + delay, std::move(callback)});
  }

  // The new deadline may be earlier than the one the thread sleeps on.
  wakeup_.notify_all();
  return id;
}

// -----------------------------------------------------------------------------
// cancel()
// -----------------------------------------------------------------------------
void LiveTimerService::cancel(TimerId id) {
  std::lock_guard lock(mutex_);
  timers_.erase(id);
}

std::size_t LiveTimerService::pending() const {
  std::lock_guard lock(mutex_);
  return timers_.size();
}

// -----------------------------------------------------------------------------
// run(): timer thread
// -----------------------------------------------------------------------------
void LiveTimerService::run() {
  std::unique_lock lock(mutex_);

  while (running_) {
    if (timers_.empty()) {
      wakeup_.wait(lock, [this] { return !running_ || !timers_.empty(); });
      continue;
    }

    auto earliest = timers_.begin();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
      if (it->second.deadline < earliest->second.deadline) {
        earliest = it;
      }
    }

    // Copied out: cancel() may erase the node while this thread waits.
    const Clock::time_point deadline = earliest->second.deadline;
    const auto now = Clock::now();
    if (deadline > now) {
      // Woken early by schedule(), cancel() or stop(): loop and re-scan.
      wakeup_.wait_until(lock, deadline);
      continue;
    }

    // Collect everything that is due, then run it without the lock.
    std::vector<std::function<void()>> due;
    for (auto it = timers_.begin(); it != timers_.end();) {
      if (it->second.deadline <= now) {
        due.push_back(std::move(it->second.callback));
        it = timers_.erase(it);
      } else {
        ++it;
      }
    }

    lock.unlock();
    for (auto& callback : due) {
      try {
        callback();
      } catch (const std::exception& e) {
        std::cerr << "[LiveTimerService] callback failed: " << e.what()
                  << "\n";
      }
    }
    lock.lock();
  }
}

}  // namespace pulse
