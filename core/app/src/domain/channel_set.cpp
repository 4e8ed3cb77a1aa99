#include "pulse/domain/channel_set.hpp"

#include <algorithm>
#include <cstring>

namespace pulse {
namespace domain {

bool isPresenceChannel(const std::string& name) {
  const std::size_t suffix_len = std::strlen(kPresenceSuffix);
  return name.size() >= suffix_len &&
         name.compare(name.size() - suffix_len, suffix_len, kPresenceSuffix) ==
             0;
}

ChannelSet::ChannelSet(std::initializer_list<std::string> names) {
  for (const auto& name : names) {
    insert(name);
  }
}

ChannelSet::ChannelSet(const std::vector<std::string>& names) {
  for (const auto& name : names) {
    insert(name);
  }
}

bool ChannelSet::insert(const std::string& name) {
  if (!index_.insert(name).second) {
    return false;
  }
  names_.push_back(name);
  return true;
}

bool ChannelSet::erase(const std::string& name) {
  if (index_.erase(name) == 0) {
    return false;
  }
  names_.erase(std::find(names_.begin(), names_.end(), name));
  return true;
}

bool ChannelSet::contains(const std::string& name) const {
  return index_.count(name) != 0;
}

ChannelSet ChannelSet::unionWith(const ChannelSet& other) const {
  ChannelSet result = *this;
  for (const auto& name : other.names_) {
    result.insert(name);
  }
  return result;
}

ChannelSet ChannelSet::difference(const ChannelSet& other) const {
  ChannelSet result;
  for (const auto& name : names_) {
    if (!other.contains(name)) {
      result.insert(name);
    }
  }
  return result;
}

ChannelSet ChannelSet::intersection(const ChannelSet& other) const {
  ChannelSet result;
  for (const auto& name : names_) {
    if (other.contains(name)) {
      result.insert(name);
    }
  }
  return result;
}

ChannelSet ChannelSet::withoutPresenceChannels() const {
  ChannelSet result;
  for (const auto& name : names_) {
    if (!isPresenceChannel(name)) {
      result.insert(name);
    }
  }
  return result;
}

std::string ChannelSet::join(char separator) const {
  std::string out;
  for (const auto& name : names_) {
    if (!out.empty()) {
      out += separator;
    }
    out += name;
  }
  return out;
}

}  // namespace domain
}  // namespace pulse
