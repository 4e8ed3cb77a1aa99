#pragma once

#include <functional>

namespace pulse {

// Unit of work posted to an executor.
using Task = std::function<void()>;

// -----------------------------------------------------------------------------
// IExecutor: where a piece of work runs
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "run this later, somewhere" so that engines do not own
//         threads directly.
//
// @details
// Two roles exist in the runtime:
//   - Engine lane:  a SerialExecutor. Tasks run one at a time in post order,
//                   which is what gives each event engine its
//                   single-threaded processing guarantee.
//   - I/O workers:  a ThreadPoolExecutor. Blocking transport calls run here
//                   so that a 310 s long-poll never stalls a lane.
//
// Tests inject deterministic executors instead (see tests/support).
//
// Thread-safety contract: post() must be callable from any thread.
// -----------------------------------------------------------------------------
class IExecutor {
 public:
  virtual ~IExecutor() = default;

  // Queues `task` for execution. Never runs it synchronously inside post()
  // for the threaded implementations.
  virtual void post(Task task) = 0;
};

}  // namespace pulse
