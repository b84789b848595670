#include "local_cache.hpp"

namespace statecore::cache {

LocalCache::LocalCache(std::size_t max_entries) : max_entries_(max_entries == 0 ? 1 : max_entries) {
}

void LocalCache::EraseLocked(std::unordered_map<std::string, Entry>::iterator it) {
  lru_.erase(it->second.lru);
  entries_.erase(it);
}

std::optional<v1::EntitySnapshot> LocalCache::Get(const std::string& key) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;

  if (it->second.expires_at <= util::Now()) {
    EraseLocked(it);
    ++evictions_;
    return std::nullopt;
  }

  lru_.splice(lru_.begin(), lru_, it->second.lru);
  return it->second.snapshot;
}

void LocalCache::Put(const std::string& key, const v1::EntitySnapshot& snapshot, std::chrono::milliseconds ttl) {
  std::lock_guard lock(mutex_);
  const auto      expires_at = util::Now() + ttl;

  auto it = entries_.find(key);
  if (it != entries_.end()) {
    if (it->second.snapshot.version() > snapshot.version()) return;
    it->second.snapshot   = snapshot;
    it->second.expires_at = expires_at;
    lru_.splice(lru_.begin(), lru_, it->second.lru);
    return;
  }

  lru_.push_front(key);
  entries_.emplace(key, Entry{snapshot, expires_at, lru_.begin()});

  while (entries_.size() > max_entries_) {
    EraseLocked(entries_.find(lru_.back()));
    ++evictions_;
  }
}

bool LocalCache::Erase(const std::string& key) {
  std::lock_guard lock(mutex_);
  auto            it = entries_.find(key);
  if (it == entries_.end()) return false;
  EraseLocked(it);
  return true;
}

std::vector<std::pair<std::string, uint64_t>> LocalCache::Versions() {
  std::lock_guard lock(mutex_);
  const auto      now = util::Now();

  std::vector<std::pair<std::string, uint64_t>> out;
  out.reserve(entries_.size());
  for (const auto& [key, entry] : entries_) {
    if (entry.expires_at > now) out.emplace_back(key, entry.snapshot.version());
  }
  return out;
}

std::size_t LocalCache::Size() {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

uint64_t LocalCache::Evictions() {
  std::lock_guard lock(mutex_);
  return evictions_;
}

} // namespace statecore::cache
