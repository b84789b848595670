#include "internal/cache/local_cache.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

namespace {

using namespace std::chrono_literals;
using statecore::cache::LocalCache;
using statecore::v1::EntitySnapshot;

EntitySnapshot Snapshot(const std::string& id, uint64_t version) {
  EntitySnapshot snapshot;
  snapshot.mutable_key()->set_type(statecore::v1::ENTITY_TYPE_TASK);
  snapshot.mutable_key()->set_id(id);
  snapshot.set_version(version);
  return snapshot;
}

void TestOlderVersionNeverReplacesNewer() {
  LocalCache cache(10);
  cache.Put("task:T1", Snapshot("T1", 3), 10s);
  cache.Put("task:T1", Snapshot("T1", 2), 10s);

  auto hit = cache.Get("task:T1");
  assert(hit.has_value());
  assert(hit->version() == 3);

  cache.Put("task:T1", Snapshot("T1", 4), 10s);
  assert(cache.Get("task:T1")->version() == 4);
}

void TestExpiredEntriesAreDropped() {
  LocalCache cache(10);
  cache.Put("task:T1", Snapshot("T1", 1), 20ms);
  std::this_thread::sleep_for(40ms);

  assert(cache.Versions().empty());
  assert(!cache.Get("task:T1").has_value());
  assert(cache.Size() == 0);
  assert(cache.Evictions() == 1);
}

void TestLeastRecentlyUsedIsEvicted() {
  LocalCache cache(2);
  cache.Put("task:A", Snapshot("A", 1), 10s);
  cache.Put("task:B", Snapshot("B", 1), 10s);

  // touch A so B becomes the oldest
  assert(cache.Get("task:A").has_value());
  cache.Put("task:C", Snapshot("C", 1), 10s);

  assert(cache.Size() == 2);
  assert(cache.Get("task:A").has_value());
  assert(!cache.Get("task:B").has_value());
  assert(cache.Get("task:C").has_value());
  assert(cache.Evictions() == 1);
}

void TestEraseReportsPresence() {
  LocalCache cache(2);
  cache.Put("task:A", Snapshot("A", 7), 10s);

  auto versions = cache.Versions();
  assert(versions.size() == 1);
  assert(versions[0].first == "task:A");
  assert(versions[0].second == 7);

  assert(cache.Erase("task:A"));
  assert(!cache.Erase("task:A"));
}

} // namespace

int main() {
  TestOlderVersionNeverReplacesNewer();
  TestExpiredEntriesAreDropped();
  TestLeastRecentlyUsedIsEvicted();
  TestEraseReportsPresence();

  std::cout << "statecore_unit_local_cache: pass\n";
  return 0;
}
