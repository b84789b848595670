#include "lock_manager.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace statecore::lock {

namespace {

using observability::IntField;
using observability::StringField;

} // namespace

LockManager::LockManager(AcquireOptions defaults) : defaults_(std::move(defaults)) {
}

LockStatus LockManager::Acquire(const std::string& owner, std::vector<std::string> keys, const AcquireOptions& options) {
  std::sort(keys.begin(), keys.end());
  keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

  const auto       deadline = util::Now() + options.timeout;
  std::unique_lock lock(mutex_);

  for (;;) {
    const auto now = util::Now();

    // Earliest expiry among the locks blocking us; reclaimable after that.
    std::optional<util::TimePoint> blocker_expiry;
    for (const auto& key : keys) {
      if (table_.CanGrant(key, owner, now)) continue;
      auto record = table_.Find(key, now);
      if (record && (!blocker_expiry || record->expires_at < *blocker_expiry)) blocker_expiry = record->expires_at;
    }

    if (!blocker_expiry) {
      // Expired locks of other owners are reclaimed here.
      for (const auto& key : keys) {
        table_.Grant(key, owner, options.holder, options.lease, now);
      }
      return LockStatus::kAcquired;
    }

    if (options.wait == WaitPolicy::kFailFast || now >= deadline) {
      STATECORE_LOG_DEBUG("lock acquisition timed out", {StringField("owner", owner), IntField("keys", static_cast<int64_t>(keys.size()))});
      return LockStatus::kTimeout;
    }

    released_.wait_until(lock, std::min(deadline, *blocker_expiry));
  }
}

void LockManager::Release(const std::string& owner) {
  std::size_t released = 0;
  {
    std::lock_guard lock(mutex_);
    released = table_.ReleaseOwner(owner);
  }
  if (released > 0) released_.notify_all();
}

std::size_t LockManager::Refresh(const std::string& owner, std::chrono::milliseconds lease) {
  std::lock_guard lock(mutex_);
  return table_.Refresh(owner, lease, util::Now());
}

LockStatus LockManager::Validate(const std::string& owner, const std::string& key) {
  std::lock_guard lock(mutex_);
  if (table_.HoldsLive(owner, key, util::Now())) return LockStatus::kAcquired;

  STATECORE_LOG_WARN("lock expired before commit", {StringField("owner", owner), StringField("key", key)});
  return LockStatus::kExpired;
}

bool LockManager::IsLockedByOther(const std::string& key, const std::string& owner) {
  std::lock_guard lock(mutex_);
  auto            record = table_.Find(key, util::Now());
  return record && record->owner != owner;
}

std::optional<LockRecord> LockManager::Inspect(const std::string& key) {
  std::lock_guard lock(mutex_);
  return table_.Find(key, util::Now());
}

} // namespace statecore::lock
