#include "pulse/dedup/dedup_cache.hpp"

#include "pulse/errors/configuration_error.hpp"

#include <cstdint>
#include <cstdio>

namespace pulse {

namespace {

// 64-bit FNV-1a. Stable across platforms and runs, unlike std::hash.
std::string payloadDigest(const std::string& payload) {
  std::uint64_t hash = 14695981039346656037ULL;
  for (unsigned char c : payload) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }

  char buffer[17];
  std::snprintf(buffer, sizeof(buffer), "%016llx",
                static_cast<unsigned long long>(hash));
  return buffer;
}

}  // namespace

DedupCache::DedupCache(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw ConfigurationError("dedup cache capacity must be greater than zero");
  }
}

bool DedupCache::shouldDeliver(const std::string& identity) {
  if (seen_.count(identity) != 0) {
    return false;
  }

  if (order_.size() >= capacity_) {
    seen_.erase(order_.front());
    order_.pop_front();
  }

  order_.push_back(identity);
  seen_.insert(identity);
  return true;
}

bool DedupCache::shouldDeliver(const domain::Message& message) {
  return shouldDeliver(identityOf(message));
}

std::string DedupCache::identityOf(const domain::Message& message) {
  std::string id = message.channel + ":" + message.published.timetoken + ":";
  if (message.sequence) {
    id += "s" + std::to_string(*message.sequence);
  } else {
    id += "d" + payloadDigest(message.payload);
  }
  return id;
}

void DedupCache::clear() {
  order_.clear();
  seen_.clear();
}

}  // namespace pulse
