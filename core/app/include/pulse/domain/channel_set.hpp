#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <unordered_set>
#include <vector>

namespace pulse {
namespace domain {

// Suffix the server appends to a channel name to form its presence channel.
inline constexpr const char* kPresenceSuffix = "-pnpres";

bool isPresenceChannel(const std::string& name);

// -----------------------------------------------------------------------------
// ChannelSet: insertion-ordered set of channel or group names
// -----------------------------------------------------------------------------
//
// @brief  Holds the channels (or channel groups) an engine is working with.
//
// @details
// Order is preserved so that request paths are stable and predictable:
// "a,b,c" stays "a,b,c" after "b" is inserted again. Inserting a present
// name is a no-op.
//
// Membership lookups go through an unordered_set index; the vector keeps
// order. Both are always updated together.
//
// Thread model:
//   Value type. Engine contexts hold their own copies.
// -----------------------------------------------------------------------------
class ChannelSet {
 public:
  ChannelSet() = default;
  ChannelSet(std::initializer_list<std::string> names);
  explicit ChannelSet(const std::vector<std::string>& names);

  // Returns true when `name` was not already present.
  bool insert(const std::string& name);

  // Returns true when `name` was present.
  bool erase(const std::string& name);

  bool contains(const std::string& name) const;
  bool empty() const { return names_.empty(); }
  std::size_t size() const { return names_.size(); }

  const std::vector<std::string>& names() const { return names_; }

  // Members of *this followed by members of `other` not already present.
  ChannelSet unionWith(const ChannelSet& other) const;

  // Members of *this that are not in `other`.
  ChannelSet difference(const ChannelSet& other) const;

  // Members of *this that are also in `other`, in *this order.
  ChannelSet intersection(const ChannelSet& other) const;

  // Drops every "-pnpres" name. Heartbeat and leave never announce them.
  ChannelSet withoutPresenceChannels() const;

  // Comma-separated rendering, e.g. "a,b,c". Empty set yields "".
  std::string join(char separator = ',') const;

  auto begin() const { return names_.begin(); }
  auto end() const { return names_.end(); }

  friend bool operator==(const ChannelSet& lhs, const ChannelSet& rhs) {
    return lhs.names_ == rhs.names_;
  }
  friend bool operator!=(const ChannelSet& lhs, const ChannelSet& rhs) {
    return !(lhs == rhs);
  }

 private:
  std::vector<std::string> names_;
  std::unordered_set<std::string> index_;
};

}  // namespace domain
}  // namespace pulse
