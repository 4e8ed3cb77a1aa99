#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace pulse {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded FIFO shared between producer and consumer threads.
// Engine lanes use it for their pending tasks; the I/O pool uses it for
// transport calls waiting for a free worker.
//
// Thread model: Safe for multiple producers and multiple consumers. pop()
// blocks until an item arrives; wait_pop() blocks up to a timeout so that
// worker loops can re-check their stop flag; try_pop() never blocks.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // Mutex and condition variable are neither copyable nor movable; share the
  // queue by reference.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // Appends one item and wakes one waiting consumer. The lock is released
  // before notifying so the woken thread does not immediately block on it.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // pop(): blocking
  // -------------------------------------------------------------------------
  // Removes and returns the front item, waiting for a producer if the queue
  // is empty. The predicate form of wait() absorbs spurious wakeups.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });

    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // wait_pop(timeout): bounded wait
  // -------------------------------------------------------------------------
  // Like pop(), but gives up after `timeout` and returns std::nullopt. Worker
  // loops use this instead of pop() so stop() is noticed within one timeout
  // even when nobody pushes.
  // -------------------------------------------------------------------------
  std::optional<T> wait_pop(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    if (!condition_.wait_for(lock, timeout,
                             [this] { return !queue_.empty(); })) {
      return std::nullopt;
    }

    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop(): non-blocking
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Snapshot only; another thread may change the queue right after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  // mutable so empty() and size() can lock while staying const.
  mutable std::mutex mutex_;

  // Signalled on push(). There is no "not full" condition: the queue is
  // unbounded.
  std::condition_variable condition_;

  std::deque<T> queue_;
};

}  // namespace pulse
