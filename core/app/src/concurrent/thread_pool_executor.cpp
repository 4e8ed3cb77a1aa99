#include "pulse/concurrent/thread_pool_executor.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace pulse {

namespace {

constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(20);

}  // namespace

ThreadPoolExecutor::ThreadPoolExecutor(std::size_t thread_count,
                                       std::string name)
    : thread_count_(thread_count == 0 ? 1 : thread_count),
      name_(std::move(name)) {}

ThreadPoolExecutor::~ThreadPoolExecutor() { stop(); }

void ThreadPoolExecutor::start() {
  if (!workers_.empty()) {
    return;
  }

  running_.store(true);
  workers_.reserve(thread_count_);
  for (std::size_t i = 0; i < thread_count_; ++i) {
    workers_.emplace_back([this] { run(); });
  }
}

void ThreadPoolExecutor::stop() {
  if (workers_.empty()) {
    return;
  }

  running_.store(false);
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

// -----------------------------------------------------------------------------
// run(): shared by every worker
// -----------------------------------------------------------------------------
// Workers leave only once stop() was called AND the queue is empty, so leave
// requests queued during shutdown still go out. Cancelled requests return on
// their first token check.
// -----------------------------------------------------------------------------
void ThreadPoolExecutor::run() {
  while (true) {
    std::optional<Task> task = queue_.wait_pop(kIdleWaitTimeout);
    if (!task) {
      if (!running_.load()) {
        break;
      }
      continue;
    }

    try {
      (*task)();
    } catch (const std::exception& e) {
      std::cerr << "[" << name_ << "] task failed: " << e.what() << "\n";
    }
  }
}

}  // namespace pulse
