#pragma once

#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/util/time.hpp"
#include "statecore/v1/entity.pb.h"

namespace statecore::cache {

/*
  L1: process-local snapshot cache.

  Entries are tagged with the version they were populated from, expire
  after their TTL and are evicted least-recently-used beyond max_entries.
  Thread-safe.
*/
class LocalCache {
 public:
  explicit LocalCache(std::size_t max_entries);

  std::optional<v1::EntitySnapshot> Get(const std::string& key);

  // An entry for a newer version is never replaced by an older one.
  void Put(const std::string& key, const v1::EntitySnapshot& snapshot, std::chrono::milliseconds ttl);

  bool Erase(const std::string& key);

  // (key, version) of every unexpired entry.
  std::vector<std::pair<std::string, uint64_t>> Versions();

  std::size_t Size();

  // Entries dropped by TTL or by the LRU bound.
  uint64_t Evictions();

 private:
  struct Entry {
    v1::EntitySnapshot               snapshot;
    util::TimePoint                  expires_at;
    std::list<std::string>::iterator lru;
  };

  void EraseLocked(std::unordered_map<std::string, Entry>::iterator it);

  std::size_t max_entries_;

  std::mutex                             mutex_;
  std::list<std::string>                 lru_;  // front = most recent
  std::unordered_map<std::string, Entry> entries_;
  uint64_t                               evictions_ = 0;
};

} // namespace statecore::cache
