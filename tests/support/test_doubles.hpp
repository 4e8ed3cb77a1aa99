// =============================================================================
// test_doubles.hpp
// =============================================================================
// Deterministic stand-ins for the runtime seams of the engines:
//
//   InlineExecutor      lane that runs tasks on the posting thread
//   ManualExecutor      I/O pool whose tasks run only when the test says so
//   ManualTimerService  timers that fire only when the test advances time
//   ScriptedTransport   ITransport with queued per-endpoint results
//
// Engine tests combine them so that every network completion and every timer
// expiry happens at a point the test chooses, on the test thread.
// =============================================================================
#pragma once

#include "pulse/concurrent/cancellation.hpp"
#include "pulse/concurrent/executor.hpp"
#include "pulse/config/endpoint_kind.hpp"
#include "pulse/time/i_timer_service.hpp"
#include "pulse/transport/i_transport.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace pulse {
namespace test {

// -----------------------------------------------------------------------------
// InlineExecutor
// -----------------------------------------------------------------------------
// Runs tasks immediately. A task posted from inside a running task is queued
// and runs after it, which preserves the one-at-a-time lane contract.
// Single-threaded use only.
// -----------------------------------------------------------------------------
class InlineExecutor final : public IExecutor {
 public:
  void post(Task task) override {
    queue_.push_back(std::move(task));
    if (draining_) {
      return;
    }

    draining_ = true;
    while (!queue_.empty()) {
      Task next = std::move(queue_.front());
      queue_.pop_front();
      next();
    }
    draining_ = false;
  }

 private:
  std::deque<Task> queue_;
  bool draining_{false};
};

// -----------------------------------------------------------------------------
// ManualExecutor
// -----------------------------------------------------------------------------
class ManualExecutor final : public IExecutor {
 public:
  void post(Task task) override {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(task));
  }

  // Runs the oldest task. Returns false when nothing was queued.
  bool runNext() {
    Task task;
    {
      std::lock_guard lock(mutex_);
      if (queue_.empty()) {
        return false;
      }
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    task();
    return true;
  }

  // Runs tasks until the queue is empty, including ones posted meanwhile.
  std::size_t runAll() {
    std::size_t count = 0;
    while (runNext()) {
      ++count;
    }
    return count;
  }

  std::size_t pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::deque<Task> queue_;
};

// -----------------------------------------------------------------------------
// ManualTimerService
// -----------------------------------------------------------------------------
// Keeps a virtual clock starting at 0. advance() moves it forward and fires
// every timer whose deadline is reached, earliest first.
// -----------------------------------------------------------------------------
class ManualTimerService final : public ITimerService {
 public:
  TimerId schedule(std::chrono::milliseconds delay,
                   std::function<void()> callback) override {
    std::lock_guard lock(mutex_);
    const TimerId id = next_id_++;
    timers_.emplace(id, Entry{now_ + delay, delay, std::move(callback)});
    last_delay_ = delay;
    return id;
  }

  void cancel(TimerId id) override {
    std::lock_guard lock(mutex_);
    timers_.erase(id);
  }

  void advance(std::chrono::milliseconds step) {
    std::chrono::milliseconds target;
    {
      std::lock_guard lock(mutex_);
      target = now_ + step;
    }

    while (true) {
      std::function<void()> callback;
      {
        std::lock_guard lock(mutex_);
        auto due = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
          if (it->second.deadline <= target &&
              (due == timers_.end() ||
               it->second.deadline < due->second.deadline)) {
            due = it;
          }
        }
        if (due == timers_.end()) {
          now_ = target;
          return;
        }
        now_ = due->second.deadline;
        callback = std::move(due->second.callback);
        timers_.erase(due);
      }
      callback();
    }
  }

  // Fires the earliest timer regardless of its delay.
  bool fireNext() {
    std::chrono::milliseconds deadline;
    {
      std::lock_guard lock(mutex_);
      if (timers_.empty()) {
        return false;
      }
      auto earliest = timers_.begin();
      for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.deadline < earliest->second.deadline) {
          earliest = it;
        }
      }
      deadline = earliest->second.deadline;
    }
    advance(deadline > now() ? deadline - now()
                             : std::chrono::milliseconds(0));
    return true;
  }

  std::size_t pending() const {
    std::lock_guard lock(mutex_);
    return timers_.size();
  }

  std::chrono::milliseconds lastDelay() const {
    std::lock_guard lock(mutex_);
    return last_delay_;
  }

  std::chrono::milliseconds now() const {
    std::lock_guard lock(mutex_);
    return now_;
  }

 private:
  struct Entry {
    std::chrono::milliseconds deadline;
    std::chrono::milliseconds delay;
    std::function<void()> callback;
  };

  mutable std::mutex mutex_;
  std::map<TimerId, Entry> timers_;
  TimerId next_id_{1};
  std::chrono::milliseconds now_{0};
  std::chrono::milliseconds last_delay_{0};
};

// -----------------------------------------------------------------------------
// ScriptedTransport
// -----------------------------------------------------------------------------
// Results are queued per endpoint kind and consumed in order. Every request
// is recorded.
//
// When nothing is queued for an endpoint:
//   - non-blocking mode (default) returns a Transport error;
//   - blocking mode waits like a real long-poll until a result is queued or
//     the token is cancelled.
// -----------------------------------------------------------------------------
class ScriptedTransport final : public transport::ITransport {
 public:
  explicit ScriptedTransport(bool block_when_empty = false)
      : block_when_empty_(block_when_empty) {}

  void enqueue(EndpointKind endpoint, transport::TransportResult result) {
    {
      std::lock_guard lock(mutex_);
      scripted_[endpoint].push_back(std::move(result));
    }
    condition_.notify_all();
  }

  void enqueueResponse(EndpointKind endpoint, int status, std::string body) {
    enqueue(endpoint, transport::Response{status, std::move(body)});
  }

  transport::TransportResult execute(const transport::Request& request,
                                     const CancellationToken& token) override {
    std::unique_lock lock(mutex_);
    requests_.push_back(request);
    condition_.notify_all();

    auto& queue = scripted_[request.endpoint];
    while (queue.empty()) {
      if (token.cancelled()) {
        return EndpointError::cancelled();
      }
      if (!block_when_empty_) {
        return EndpointError::transport("no scripted response");
      }
      condition_.wait_for(lock, std::chrono::milliseconds(10));
    }

    if (token.cancelled()) {
      return EndpointError::cancelled();
    }
    auto result = std::move(queue.front());
    queue.pop_front();
    return result;
  }

  std::vector<transport::Request> requests() const {
    std::lock_guard lock(mutex_);
    return requests_;
  }

  std::vector<transport::Request> requestsFor(EndpointKind endpoint) const {
    std::lock_guard lock(mutex_);
    std::vector<transport::Request> out;
    for (const auto& request : requests_) {
      if (request.endpoint == endpoint) {
        out.push_back(request);
      }
    }
    return out;
  }

  // Blocks until at least `count` requests for `endpoint` were executed.
  bool waitForRequests(EndpointKind endpoint, std::size_t count,
                       std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return condition_.wait_for(lock, timeout, [&] {
      std::size_t seen = 0;
      for (const auto& request : requests_) {
        if (request.endpoint == endpoint) {
          ++seen;
        }
      }
      return seen >= count;
    });
  }

 private:
  bool block_when_empty_;
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::map<EndpointKind, std::deque<transport::TransportResult>> scripted_;
  std::vector<transport::Request> requests_;
};

// Subscribe response body with cursor {tt, region} and raw message array.
inline std::string subscribeBody(const std::string& tt, int region,
                                 const std::string& messages = "[]") {
  return "{\"t\":{\"t\":\"" + tt + "\",\"r\":" + std::to_string(region) +
         "},\"m\":" + messages + "}";
}

// One message envelope for subscribeBody().
inline std::string messageJson(const std::string& channel,
                               const std::string& tt,
                               const std::string& payload,
                               long long sequence = -1) {
  std::string json = "{\"c\":\"" + channel + "\",\"b\":\"" + channel +
                     "\",\"d\":" + payload + ",\"p\":{\"t\":\"" + tt +
                     "\",\"r\":4},\"i\":\"publisher-1\"";
  if (sequence >= 0) {
    json += ",\"s\":" + std::to_string(sequence);
  }
  return json + "}";
}

}  // namespace test
}  // namespace pulse
