#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "lock.hpp"
#include "lock_table.hpp"

namespace statecore::lock {

/*
  LockManager

  Exclusive locks over logical keys, owned by transaction ids.

  - Keys are de-duplicated and sorted before acquisition.
  - Acquire is all-or-nothing: either every key is granted or none is.
  - Blocking waiters wake on release and on the expiry of a blocking lock,
    so a crashed holder delays others by at most its lease.
*/
class LockManager {
public:
  explicit LockManager(AcquireOptions defaults = {});

  LockStatus Acquire(const std::string& owner, std::vector<std::string> keys, const AcquireOptions& options);

  void Release(const std::string& owner);

  // Holder heartbeat. Returns the number of live locks extended.
  std::size_t Refresh(const std::string& owner, std::chrono::milliseconds lease);

  // kAcquired if owner still holds a live lock on key, kExpired otherwise.
  LockStatus Validate(const std::string& owner, const std::string& key);

  bool IsLockedByOther(const std::string& key, const std::string& owner);

  std::optional<LockRecord> Inspect(const std::string& key);

  const AcquireOptions& Defaults() const { return defaults_; }

private:
  AcquireOptions defaults_;

  std::mutex mutex_;
  std::condition_variable released_;
  LockTable table_;
};

}
