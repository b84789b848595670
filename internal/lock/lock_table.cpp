#include "lock_table.hpp"

#include "internal/util/uuid.hpp"

namespace statecore::lock {

bool LockTable::IsExpired(const LockRecord& record, util::TimePoint now) {
  return record.expires_at <= now;
}

void LockTable::Unindex(const std::string& owner, const std::string& key) {
  auto range = by_owner_.equal_range(owner);
  for (auto it = range.first; it != range.second; ++it) {
    if (it->second == key) {
      by_owner_.erase(it);
      return;
    }
  }
}

bool LockTable::CanGrant(const std::string& key, const std::string& owner, util::TimePoint now) const {
  auto it = locks_.find(key);
  if (it == locks_.end()) return true;
  return it->second.owner == owner || IsExpired(it->second, now);
}

LockRecord LockTable::Grant(const std::string& key, const std::string& owner, const std::string& holder, std::chrono::milliseconds lease,
                            util::TimePoint now) {
  auto it = locks_.find(key);
  if (it != locks_.end() && it->second.owner == owner && !IsExpired(it->second, now)) {
    it->second.expires_at = now + lease;
    return it->second;
  }

  if (it != locks_.end()) {
    Unindex(it->second.owner, key);
    locks_.erase(it);
  }

  LockRecord record;
  record.lock_id     = util::GenerateUUIDString();
  record.key         = key;
  record.owner       = owner;
  record.holder      = holder;
  record.acquired_at = now;
  record.expires_at  = now + lease;

  locks_.emplace(key, record);
  by_owner_.emplace(owner, key);
  return record;
}

std::optional<LockRecord> LockTable::Find(const std::string& key, util::TimePoint now) const {
  auto it = locks_.find(key);
  if (it == locks_.end() || IsExpired(it->second, now)) return std::nullopt;
  return it->second;
}

bool LockTable::HoldsLive(const std::string& owner, const std::string& key, util::TimePoint now) const {
  auto it = locks_.find(key);
  return it != locks_.end() && it->second.owner == owner && !IsExpired(it->second, now);
}

std::vector<std::string> LockTable::KeysOf(const std::string& owner) const {
  std::vector<std::string> keys;
  auto                     range = by_owner_.equal_range(owner);
  for (auto it = range.first; it != range.second; ++it) {
    keys.push_back(it->second);
  }
  return keys;
}

std::size_t LockTable::Refresh(const std::string& owner, std::chrono::milliseconds lease, util::TimePoint now) {
  std::size_t refreshed = 0;
  auto        range     = by_owner_.equal_range(owner);
  for (auto it = range.first; it != range.second; ++it) {
    auto lock_it = locks_.find(it->second);
    if (lock_it == locks_.end() || IsExpired(lock_it->second, now)) continue;
    lock_it->second.expires_at = now + lease;
    ++refreshed;
  }
  return refreshed;
}

std::size_t LockTable::ReleaseOwner(const std::string& owner) {
  std::size_t released = 0;
  auto        range    = by_owner_.equal_range(owner);
  for (auto it = range.first; it != range.second; ++it) {
    auto lock_it = locks_.find(it->second);
    if (lock_it != locks_.end() && lock_it->second.owner == owner) {
      locks_.erase(lock_it);
      ++released;
    }
  }
  by_owner_.erase(owner);
  return released;
}

} // namespace statecore::lock
