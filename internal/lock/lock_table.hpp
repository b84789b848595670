#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "lock.hpp"

namespace statecore::lock {

/*
  Key -> lock record, with an owner index.

  Not synchronized: LockManager serializes access. An expired record is
  treated as absent and may be reclaimed by any owner.
*/
class LockTable {
 public:
  // True when the key is free, expired, or already held by owner.
  bool CanGrant(const std::string& key, const std::string& owner, util::TimePoint now) const;

  // Grants or extends. Precondition: CanGrant.
  LockRecord Grant(const std::string& key, const std::string& owner, const std::string& holder, std::chrono::milliseconds lease,
                   util::TimePoint now);

  // Live record for a key.
  std::optional<LockRecord> Find(const std::string& key, util::TimePoint now) const;

  // True only if owner holds a live lock on key.
  bool HoldsLive(const std::string& owner, const std::string& key, util::TimePoint now) const;

  std::vector<std::string> KeysOf(const std::string& owner) const;

  // Extends every live lock of owner; returns how many were extended.
  std::size_t Refresh(const std::string& owner, std::chrono::milliseconds lease, util::TimePoint now);

  std::size_t ReleaseOwner(const std::string& owner);

  std::size_t Size() const {
    return locks_.size();
  }

 private:
  static bool IsExpired(const LockRecord& record, util::TimePoint now);
  void        Unindex(const std::string& owner, const std::string& key);

  std::unordered_map<std::string, LockRecord>       locks_;
  std::unordered_multimap<std::string, std::string> by_owner_;
};

} // namespace statecore::lock
