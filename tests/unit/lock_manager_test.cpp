#include "internal/lock/lock_manager.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

namespace {

using namespace std::chrono_literals;
using statecore::lock::AcquireOptions;
using statecore::lock::LockManager;
using statecore::lock::LockStatus;
using statecore::lock::WaitPolicy;

AcquireOptions Options(std::chrono::milliseconds timeout, WaitPolicy wait = WaitPolicy::kBlock, std::chrono::milliseconds lease = 30s) {
  AcquireOptions options;
  options.timeout = timeout;
  options.wait    = wait;
  options.lease   = lease;
  options.holder  = "test";
  return options;
}

void TestFailFastReturnsTimeout() {
  LockManager locks;
  assert(locks.Acquire("tx-a", {"task:T1"}, Options(1s)) == LockStatus::kAcquired);
  assert(locks.Acquire("tx-b", {"task:T1"}, Options(1s, WaitPolicy::kFailFast)) == LockStatus::kTimeout);
  assert(locks.IsLockedByOther("task:T1", "tx-b"));
  assert(!locks.IsLockedByOther("task:T1", "tx-a"));
}

void TestBlockedAcquireProceedsAfterRelease() {
  LockManager locks;
  assert(locks.Acquire("tx-a", {"task:T1"}, Options(1s)) == LockStatus::kAcquired);

  std::atomic<bool> acquired{false};
  std::thread       waiter([&] {
    auto status = locks.Acquire("tx-b", {"task:T1"}, Options(5s));
    acquired    = status == LockStatus::kAcquired;
  });

  std::this_thread::sleep_for(50ms);
  assert(!acquired.load());

  locks.Release("tx-a");
  waiter.join();
  assert(acquired.load());

  auto record = locks.Inspect("task:T1");
  assert(record.has_value());
  assert(record->owner == "tx-b");
}

void TestAcquireIsAllOrNothing() {
  LockManager locks;
  assert(locks.Acquire("tx-a", {"b"}, Options(1s)) == LockStatus::kAcquired);

  assert(locks.Acquire("tx-b", {"c", "a", "b", "a"}, Options(20ms)) == LockStatus::kTimeout);
  assert(!locks.Inspect("a").has_value());
  assert(!locks.Inspect("c").has_value());
}

void TestExpiredHolderIsReclaimedAndFailsValidation() {
  LockManager locks;
  assert(locks.Acquire("tx-a", {"task:T1"}, Options(1s, WaitPolicy::kBlock, 30ms)) == LockStatus::kAcquired);

  // Blocks until the lease lapses, then takes over.
  assert(locks.Acquire("tx-b", {"task:T1"}, Options(2s)) == LockStatus::kAcquired);
  assert(locks.Validate("tx-a", "task:T1") == LockStatus::kExpired);
  assert(locks.Validate("tx-b", "task:T1") == LockStatus::kAcquired);
}

void TestRefreshKeepsLeaseAlive() {
  LockManager locks;
  assert(locks.Acquire("tx-a", {"task:T1"}, Options(1s, WaitPolicy::kBlock, 100ms)) == LockStatus::kAcquired);
  assert(locks.Refresh("tx-a", 10s) == 1);

  std::this_thread::sleep_for(150ms);
  assert(locks.Validate("tx-a", "task:T1") == LockStatus::kAcquired);
}

void TestOppositeOrderRequestsDoNotDeadlock() {
  LockManager locks;
  std::atomic<int> granted{0};

  auto worker = [&](const std::string& owner, std::vector<std::string> keys) {
    for (int i = 0; i < 50; ++i) {
      if (locks.Acquire(owner, keys, Options(5s)) == LockStatus::kAcquired) {
        ++granted;
        locks.Release(owner);
      }
    }
  };

  std::thread a(worker, "tx-a", std::vector<std::string>{"x", "y"});
  std::thread b(worker, "tx-b", std::vector<std::string>{"y", "x"});
  a.join();
  b.join();
  assert(granted.load() == 100);
}

} // namespace

int main() {
  TestFailFastReturnsTimeout();
  TestBlockedAcquireProceedsAfterRelease();
  TestAcquireIsAllOrNothing();
  TestExpiredHolderIsReclaimedAndFailsValidation();
  TestRefreshKeepsLeaseAlive();
  TestOppositeOrderRequestsDoNotDeadlock();

  std::cout << "statecore_unit_lock_manager: pass\n";
  return 0;
}
