#include "internal/cache/cache_manager.hpp"

#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/event_log.hpp"
#include "internal/txn/transaction_manager.hpp"

namespace {

using namespace std::chrono_literals;
using namespace statecore;

struct Harness {
  std::shared_ptr<db::Repository>          repository = std::make_shared<db::memory::MemoryRepository>();
  std::shared_ptr<store::VersionStore>     versions   = std::make_shared<store::VersionStore>(repository);
  std::shared_ptr<store::EventLog>         events     = std::make_shared<store::EventLog>(repository);
  std::shared_ptr<lock::LockManager>       locks      = std::make_shared<lock::LockManager>();
  std::shared_ptr<txn::TransactionManager> txns       = std::make_shared<txn::TransactionManager>(repository, versions, events, locks);

  std::shared_ptr<cache::CacheManager> MakeCache(std::shared_ptr<cache::SharedCacheTier> l2, bool listen = true) {
    auto cache = std::make_shared<cache::CacheManager>(versions, std::move(l2), cache::DependencyTable::WithDefaults(),
                                                       cache::CacheOptions::WithDefaults());
    if (listen) txns->AddListener(cache);
    return cache;
  }

  uint64_t Set(const model::EntityKey& key, const std::string& field, const std::string& value) {
    auto result = txns->RunWithRetry(txn::Mode::kOptimistic, [&](txn::Transaction& txn) {
      return txn.StageWrite(key, [&](google::protobuf::Struct& payload) { (*payload.mutable_fields())[field].set_string_value(value); });
    });
    assert(result.status.ok());
    return result.committed.front().second;
  }
};

// Shared tier that is down.
class FailingSharedCache final : public cache::SharedCacheTier {
 public:
  std::optional<std::string> Get(const std::string&) override {
    throw std::runtime_error("connection refused");
  }
  void Put(const std::string&, const std::string&, std::chrono::milliseconds) override {
    throw std::runtime_error("connection refused");
  }
  void Erase(const std::string&) override {
    throw std::runtime_error("connection refused");
  }
  std::vector<std::string> Keys() override {
    throw std::runtime_error("connection refused");
  }
};

// Runs a one-shot hook inside Get, to interleave an invalidation with a read.
class HookedSharedCache final : public cache::SharedCacheTier {
 public:
  std::function<void()> on_get;

  std::optional<std::string> Get(const std::string& key) override {
    if (on_get) {
      auto hook = std::move(on_get);
      on_get    = nullptr;
      hook();
    }
    return inner_.Get(key);
  }
  void Put(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) override {
    inner_.Put(key, value, ttl);
  }
  void Erase(const std::string& key) override {
    inner_.Erase(key);
  }
  std::vector<std::string> Keys() override {
    return inner_.Keys();
  }

 private:
  cache::MemorySharedCache inner_;
};

const auto kT1 = model::MakeKey(v1::ENTITY_TYPE_TASK, "T1");
const auto kT2 = model::MakeKey(v1::ENTITY_TYPE_TASK, "T2");

void TestReadThroughThenHit() {
  Harness h;
  auto    cache = h.MakeCache(std::make_shared<cache::MemorySharedCache>());
  h.Set(kT1, "status", "pending");

  assert(cache->Get(kT1)->version() == 1);
  assert(cache->Get(kT1)->version() == 1);

  auto stats = cache->Stats();
  assert(stats.store_reads == 1);
  assert(stats.l1.hits == 1);
  assert(stats.l1.misses == 1);
  assert(stats.l2.misses == 1);

  assert(!cache->Get(model::MakeKey(v1::ENTITY_TYPE_TASK, "missing")).has_value());
}

void TestCommitInvalidatesKeyAndDependents() {
  Harness h;
  auto    cache = h.MakeCache(std::make_shared<cache::MemorySharedCache>());

  const auto workflow = model::MakeKey(v1::ENTITY_TYPE_WORKFLOW, "W1");
  const auto agent    = model::MakeKey(v1::ENTITY_TYPE_AGENT, "A1");
  h.Set(workflow, "name", "etl");
  h.Set(agent, "name", "worker");
  h.Set(kT1, "workflow_id", "W1");

  assert(cache->Get(workflow).has_value());
  assert(cache->Get(agent).has_value());
  assert(cache->Get(kT1)->version() == 1);
  const auto reads_before = cache->Stats().store_reads;

  h.Set(kT1, "assigned_agent", "A1");

  // task, its workflow (previous and new payload) and its agent
  assert(cache->Get(kT1)->version() == 2);
  assert(cache->Get(workflow).has_value());
  assert(cache->Get(agent).has_value());
  assert(cache->Stats().store_reads == reads_before + 3);
}

void TestSharedTierServesOtherInstances() {
  Harness h;
  auto    shared = std::make_shared<cache::MemorySharedCache>();
  auto    a      = h.MakeCache(shared);
  auto    b      = h.MakeCache(shared);
  h.Set(kT1, "status", "pending");

  assert(a->Get(kT1).has_value());
  assert(b->Get(kT1)->version() == 1);
  assert(b->Stats().l2.hits == 1);
  assert(b->Stats().store_reads == 0);

  h.Set(kT1, "status", "running");
  assert(shared->Keys().empty());
  assert(b->Get(kT1)->version() == 2);
}

void TestFailingSharedTierFailsOpen() {
  Harness h;
  auto    cache = h.MakeCache(std::make_shared<FailingSharedCache>());
  h.Set(kT1, "status", "pending");

  assert(cache->Get(kT1)->version() == 1);
  h.Set(kT1, "status", "running");
  assert(cache->Get(kT1)->version() == 2);

  auto stats = cache->Stats();
  assert(stats.l2.errors >= 3);
  assert(stats.store_reads == 2);

  // The sweep still checks L1 when L2 is down.
  assert(cache->ReconcileOnce() == 0);
}

void TestReconcileRepairsMissedInvalidation() {
  Harness h;
  auto    deaf = h.MakeCache(nullptr, false);
  h.Set(kT1, "status", "pending");

  assert(deaf->Get(kT1)->version() == 1);
  h.Set(kT1, "status", "running");

  // No invalidation reached this instance.
  assert(deaf->Get(kT1)->version() == 1);

  assert(deaf->ReconcileOnce() == 1);
  assert(deaf->Get(kT1)->version() == 2);
  assert(deaf->ReconcileOnce() == 0);
}

void TestReconcileSweepsSharedTier() {
  Harness h;
  auto    shared = std::make_shared<cache::MemorySharedCache>();
  auto    deaf   = h.MakeCache(shared, false);
  h.Set(kT1, "status", "pending");
  assert(deaf->Get(kT1).has_value());

  h.Set(kT1, "status", "running");
  shared->Put("task:bogus", "not a snapshot", 10s);

  assert(deaf->ReconcileOnce() == 3);
  assert(shared->Keys().empty());
}

void TestInvalidationDuringReadSkipsFill() {
  Harness h;
  auto    tier  = std::make_shared<HookedSharedCache>();
  auto    cache = h.MakeCache(tier);
  h.Set(kT1, "status", "pending");

  tier->on_get = [&] { cache->Invalidate(kT1); };

  assert(cache->Get(kT1)->version() == 1);
  assert(cache->Stats().stale_fills_skipped == 1);
  assert(tier->Keys().empty());

  // The next read fills normally.
  assert(cache->Get(kT1)->version() == 1);
  assert(cache->Get(kT1).has_value());
  assert(cache->Stats().l1.hits == 1);
}

void TestReconcileForgetsUncachedGenerations() {
  Harness h;
  auto    tier  = std::make_shared<HookedSharedCache>();
  auto    cache = h.MakeCache(tier);
  h.Set(kT1, "status", "pending");
  h.Set(kT2, "status", "pending");
  assert(cache->Stats().tracked_generations == 2);

  assert(cache->Get(kT1).has_value());
  assert(cache->ReconcileOnce() == 0);
  assert(cache->Stats().tracked_generations == 1);

  // T2 is invalidated and then forgotten while a read of it is in flight.
  tier->on_get = [&] {
    cache->Invalidate(kT2);
    cache->ReconcileOnce();
  };
  assert(cache->Get(kT2)->version() == 1);
  assert(cache->Stats().stale_fills_skipped == 1);
  assert(cache->Stats().tracked_generations == 1);

  const auto hits = cache->Stats().l1.hits;
  assert(cache->Get(kT2).has_value());
  assert(cache->Get(kT2).has_value());
  assert(cache->Stats().l1.hits == hits + 1);
}

void TestTypeTtlOverridesDefaults() {
  auto options = cache::CacheOptions::WithDefaults();
  assert(options.l1_type_ttl.at(v1::ENTITY_TYPE_TASK) == 180s);
  assert(options.l1_type_ttl.at(v1::ENTITY_TYPE_SYSTEM) == 600s);
  assert(options.l2_type_ttl.at(v1::ENTITY_TYPE_AGENT) == 1800s);
  assert(options.l1_ttl == 300s);
  assert(options.l2_ttl == 3600s);
}

} // namespace

int main() {
  TestReadThroughThenHit();
  TestCommitInvalidatesKeyAndDependents();
  TestSharedTierServesOtherInstances();
  TestFailingSharedTierFailsOpen();
  TestReconcileRepairsMissedInvalidation();
  TestReconcileSweepsSharedTier();
  TestInvalidationDuringReadSkipsFill();
  TestReconcileForgetsUncachedGenerations();
  TestTypeTtlOverridesDefaults();

  std::cout << "statecore_unit_cache_manager: pass\n";
  return 0;
}
