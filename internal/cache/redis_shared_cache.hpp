#pragma once

#include <memory>
#include <string>

#include <sw/redis++/redis++.h>

#include "shared_cache.hpp"

namespace statecore::cache {

/*
  L2 tier backed by Redis through redis++.

  Keys are stored as <prefix><type>:<id> with a server-side TTL.
  redis++ errors propagate as sw::redis::Error; the Cache Manager
  fails open on them.
*/
class RedisSharedCache final : public SharedCacheTier {
 public:
  RedisSharedCache(const std::string& uri, std::string key_prefix);

  std::optional<std::string> Get(const std::string& key) override;
  void                       Put(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) override;
  void                       Erase(const std::string& key) override;
  std::vector<std::string>   Keys() override;

 private:
  std::unique_ptr<sw::redis::Redis> native_;
  std::string                       prefix_;
};

} // namespace statecore::cache
