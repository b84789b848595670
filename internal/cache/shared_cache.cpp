#include "shared_cache.hpp"

namespace statecore::cache {

std::optional<std::string> MemorySharedCache::Get(const std::string& key) {
  std::lock_guard lock(mutex_);
  auto            it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;
  if (it->second.expires_at <= util::Now()) {
    entries_.erase(it);
    return std::nullopt;
  }
  return it->second.value;
}

void MemorySharedCache::Put(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) {
  std::lock_guard lock(mutex_);
  entries_[key] = Entry{value, util::Now() + ttl};
}

void MemorySharedCache::Erase(const std::string& key) {
  std::lock_guard lock(mutex_);
  entries_.erase(key);
}

std::vector<std::string> MemorySharedCache::Keys() {
  std::lock_guard lock(mutex_);
  const auto      now = util::Now();

  std::vector<std::string> keys;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.expires_at <= now) {
      it = entries_.erase(it);
      continue;
    }
    keys.push_back(it->first);
    ++it;
  }
  return keys;
}

} // namespace statecore::cache
