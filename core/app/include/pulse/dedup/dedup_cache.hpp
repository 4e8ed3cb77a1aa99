#pragma once

#include "pulse/domain/message.hpp"

#include <cstddef>
#include <deque>
#include <string>
#include <unordered_set>

namespace pulse {

// -----------------------------------------------------------------------------
// DedupCache: bounded FIFO of recently delivered message identities
// -----------------------------------------------------------------------------
//
// @brief  Suppresses messages the subscribe loop has already surfaced, for
//         example after a reconnect replays part of the stream.
//
// @details
// Identity is "channel:timetoken:s<sequence>" when the publish sequence is
// known and "channel:timetoken:d<digest>" otherwise (FNV-1a over the raw
// payload, hex). See identityOf().
//
// When full, the oldest inserted identity is evicted before the new one is
// added, so size() never exceeds capacity().
//
// Thread model:
//   Owned by the subscription engine's effect handler; touched only on its
//   lane. Not thread-safe.
// -----------------------------------------------------------------------------
class DedupCache {
 public:
  // Throws ConfigurationError when `capacity` is zero.
  explicit DedupCache(std::size_t capacity);

  // Returns true and records `identity` if it has not been seen inside the
  // window; false otherwise.
  bool shouldDeliver(const std::string& identity);

  // Convenience overload over identityOf(message).
  bool shouldDeliver(const domain::Message& message);

  static std::string identityOf(const domain::Message& message);

  std::size_t size() const { return order_.size(); }
  std::size_t capacity() const { return capacity_; }
  void clear();

 private:
  std::size_t capacity_;
  std::deque<std::string> order_;
  std::unordered_set<std::string> seen_;
};

}  // namespace pulse
