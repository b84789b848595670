#pragma once

#include <chrono>
#include <string>

#include "internal/util/time.hpp"

namespace statecore::lock {

// One exclusive lock on a logical key ("task:T1" or any caller-chosen name).
struct LockRecord {
  std::string lock_id;
  std::string key;
  std::string owner;   // transaction id
  std::string holder;  // actor, for inspection

  util::TimePoint acquired_at;
  util::TimePoint expires_at;
};

enum class WaitPolicy {
  kBlock,
  kFailFast,
};

struct AcquireOptions {
  std::chrono::milliseconds timeout{10000};
  WaitPolicy                wait = WaitPolicy::kBlock;
  std::chrono::milliseconds lease{30000};
  std::string               holder;
};

enum class LockStatus {
  kAcquired,
  kTimeout,
  kExpired,
};

} // namespace statecore::lock
