#include "pulse/concurrent/serial_executor.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace pulse {

namespace {

// How long the worker blocks on an empty queue before re-checking running_.
// wait_pop() wakes immediately on post(), so this only bounds stop() latency.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

SerialExecutor::SerialExecutor(std::string name) : name_(std::move(name)) {}

SerialExecutor::~SerialExecutor() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void SerialExecutor::start() {
  if (thread_.joinable()) {
    return;
  }

  // Set before spawning so the worker's first check sees true.
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void SerialExecutor::stop() {
  if (!thread_.joinable()) {
    return;
  }

  running_.store(false);

  // No lock is held across join(); the worker never waits on anything we own
  // here except the queue, which it leaves within kIdleWaitTimeout.
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void SerialExecutor::run() {
  while (running_.load()) {
    std::optional<Task> task = queue_.wait_pop(kIdleWaitTimeout);
    if (!task) {
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
