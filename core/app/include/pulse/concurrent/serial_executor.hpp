#pragma once

#include "pulse/concurrent/executor.hpp"
#include "pulse/concurrent/thread_safe_queue.hpp"

#include <atomic>
#include <string>
#include <thread>

namespace pulse {

// -----------------------------------------------------------------------------
// SerialExecutor
// -----------------------------------------------------------------------------
// Responsibility: Owns a single worker thread that drains a
// ThreadSafeQueue<Task> and runs each task on that thread, in post order.
// This is the processing lane of one event engine: every event, every
// state swap and every effect dispatch of that engine happens here, so the
// engine never needs a lock around its transition logic.
//
// Thread model: start() and stop() may be called from any thread. post() is
// thread-safe. Tasks run only on the owned thread. A task that throws
// std::exception is logged and the lane keeps running.
// -----------------------------------------------------------------------------
class SerialExecutor final : public IExecutor {
 public:
  // `name` prefixes log lines, e.g. "SubscribeLane".
  explicit SerialExecutor(std::string name = "SerialExecutor");

  // Joins the worker so queued tasks never touch a destroyed object.
  ~SerialExecutor() override;

  SerialExecutor(const SerialExecutor&) = delete;
  SerialExecutor& operator=(const SerialExecutor&) = delete;
  SerialExecutor(SerialExecutor&&) = delete;
  SerialExecutor& operator=(SerialExecutor&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Spawns the worker. Tasks posted before start() are kept and run once the
  // worker is up. Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Signals the worker to exit and joins it. The task currently running is
  // allowed to finish; tasks still queued stay queued and run after a later
  // start(). Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // Enqueues a task for the lane.
  void post(Task task) override { queue_.push(std::move(task)); }

  const std::string& name() const { return name_; }

 private:
  void run();

  std::string name_;
  ThreadSafeQueue<Task> queue_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace pulse
