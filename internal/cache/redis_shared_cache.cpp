#include "redis_shared_cache.hpp"

#include <iterator>

namespace statecore::cache {

namespace redis = sw::redis;

RedisSharedCache::RedisSharedCache(const std::string& uri, std::string key_prefix)
    : native_(std::make_unique<redis::Redis>(uri)), prefix_(key_prefix.empty() ? "statecore:" : std::move(key_prefix)) {
}

std::optional<std::string> RedisSharedCache::Get(const std::string& key) {
  redis::OptionalString value = native_->get(prefix_ + key);
  if (!value) return std::nullopt;
  return *value;
}

void RedisSharedCache::Put(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) {
  native_->set(prefix_ + key, value, ttl);
}

void RedisSharedCache::Erase(const std::string& key) {
  native_->del(prefix_ + key);
}

std::vector<std::string> RedisSharedCache::Keys() {
  std::vector<std::string> raw;
  long long                cursor = 0;
  do {
    cursor = native_->scan(cursor, prefix_ + "*", 256, std::back_inserter(raw));
  } while (cursor != 0);

  std::vector<std::string> keys;
  keys.reserve(raw.size());
  for (auto& k : raw) {
    keys.push_back(k.substr(prefix_.size()));
  }
  return keys;
}

} // namespace statecore::cache
