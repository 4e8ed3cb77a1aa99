#pragma once

#include "pulse/concurrent/executor.hpp"
#include "pulse/concurrent/thread_safe_queue.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <thread>
#include <vector>

namespace pulse {

// -----------------------------------------------------------------------------
// ThreadPoolExecutor: I/O workers for blocking transport calls
// -----------------------------------------------------------------------------
//
// @brief  Fixed set of worker threads sharing one task queue.
//
// @details
// Handshake and receive calls are long-polls that may block a worker for
// minutes; heartbeats and leaves are short. The pool is sized so that one
// subscribe long-poll, one heartbeat and a couple of leave requests can be
// in flight at the same time (Configuration::io_threads, default 4).
//
// Unlike SerialExecutor there is no ordering guarantee between tasks.
//
// Thread model:
//   post() is safe from any thread. start()/stop() are intended for the
//   owning thread (RealtimeClient). stop() drains the queue and joins every
//   worker; a worker busy inside a transport call finishes that call first,
//   so owners cancel in-flight effects before stopping the pool.
// -----------------------------------------------------------------------------
class ThreadPoolExecutor final : public IExecutor {
 public:
  explicit ThreadPoolExecutor(std::size_t thread_count,
                              std::string name = "IoPool");

  ~ThreadPoolExecutor() override;

  ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
  ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
  ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
  ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

  void start();
  void stop();

  void post(Task task) override { queue_.push(std::move(task)); }

  std::size_t threadCount() const { return thread_count_; }

 private:
  void run();

  std::size_t thread_count_;
  std::string name_;
  ThreadSafeQueue<Task> queue_;
  std::atomic<bool> running_{false};
  std::vector<std::thread> workers_;
};

}  // namespace pulse
