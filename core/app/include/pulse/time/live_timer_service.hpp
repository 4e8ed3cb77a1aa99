#pragma once

#include "pulse/time/i_timer_service.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>
#include <thread>

namespace pulse {

// -----------------------------------------------------------------------------
// LiveTimerService: wall-clock implementation of ITimerService
// -----------------------------------------------------------------------------
//
// @brief  Single background thread that sleeps until the earliest armed
//         deadline and runs due callbacks.
//
// @details
// Deadlines are std::chrono::steady_clock time points so that a wall-clock
// adjustment never shortens or stretches a heartbeat cooldown.
//
// The number of simultaneously armed timers is tiny (one retry wait per
// subscription channel, one cooldown per presence engine), so the schedule
// is a std::map keyed by TimerId and the earliest deadline is found by a
// linear scan.
//
// Thread model:
//   start()/stop() from the owning thread. schedule()/cancel() from any
//   thread. Callbacks run on the timer thread with no lock held, so they may
//   schedule or cancel other timers.
// -----------------------------------------------------------------------------
class LiveTimerService final : public ITimerService {
 public:
  LiveTimerService() = default;

  // Stops and joins the timer thread.
  ~LiveTimerService() override;

  LiveTimerService(const LiveTimerService&) = delete;
  LiveTimerService& operator=(const LiveTimerService&) = delete;
  LiveTimerService(LiveTimerService&&) = delete;
  LiveTimerService& operator=(LiveTimerService&&) = delete;

  // Spawns the timer thread. Timers scheduled earlier keep their deadlines.
  void start();

  // Joins the timer thread and discards every armed timer.
  void stop();

  TimerId schedule(std::chrono::milliseconds delay,
                   std::function<void()> callback) override;

  void cancel(TimerId id) override;

  // Number of armed timers. Snapshot only.
  std::size_t pending() const;

 private:
  using Clock = std::chrono::steady_clock;

  struct Entry {
    Clock::time_point deadline;
    std::function<void()> callback;
  };

  void run();

  mutable std::mutex mutex_;
  std::condition_variable wakeup_;
  std::map<TimerId, Entry> timers_;
  TimerId next_id_{1};
  bool running_{false};
  std::thread thread_;
};

}  // namespace pulse
