#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/util/time.hpp"

namespace statecore::cache {

/*
  L2: cache tier shared between processes (or between Cache Manager
  instances). Values are serialized EntitySnapshot messages.

  Implementations may throw on outage; the Cache Manager treats any
  exception as a miss and falls through to the Version Store.
*/
class SharedCacheTier {
 public:
  virtual ~SharedCacheTier() = default;

  virtual std::optional<std::string> Get(const std::string& key) = 0;

  virtual void Put(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) = 0;

  virtual void Erase(const std::string& key) = 0;

  // Every live key, for the reconciliation sweep.
  virtual std::vector<std::string> Keys() = 0;
};

// In-process shared tier. One instance may back several Cache Managers.
class MemorySharedCache final : public SharedCacheTier {
 public:
  std::optional<std::string> Get(const std::string& key) override;
  void                       Put(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) override;
  void                       Erase(const std::string& key) override;
  std::vector<std::string>   Keys() override;

 private:
  struct Entry {
    std::string     value;
    util::TimePoint expires_at;
  };

  std::mutex                             mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace statecore::cache
