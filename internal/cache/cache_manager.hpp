#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "dependency_table.hpp"
#include "internal/store/version_store.hpp"
#include "internal/txn/commit_listener.hpp"
#include "local_cache.hpp"
#include "shared_cache.hpp"

namespace statecore::cache {

struct CacheOptions {
  std::chrono::milliseconds l1_ttl{std::chrono::seconds(300)};
  std::size_t               l1_max_entries = 10000;
  std::chrono::milliseconds l2_ttl{std::chrono::seconds(3600)};

  std::map<model::EntityType, std::chrono::milliseconds> l1_type_ttl;
  std::map<model::EntityType, std::chrono::milliseconds> l2_type_ttl;

  std::chrono::milliseconds reconcile_interval{std::chrono::seconds(30)};

  // task 180s / system 600s on L1, task 900s / agent and resource 1800s on L2
  static CacheOptions WithDefaults();
};

struct TierStats {
  uint64_t hits      = 0;
  uint64_t misses    = 0;
  uint64_t evictions = 0;
  uint64_t errors    = 0;
};

struct CacheStats {
  TierStats l1;
  TierStats l2;
  uint64_t  store_reads   = 0;
  uint64_t  invalidations = 0;
  // Store reads not cached because the key was invalidated meanwhile.
  uint64_t  stale_fills_skipped = 0;
  // Keys with a live invalidation generation.
  uint64_t  tracked_generations = 0;
};

/*
  CacheManager

  Read-through, write-invalidate cache in front of the Version Store:
  L1 -> L2 (fills L1) -> Version Store (fills both).

  Every key carries an invalidation generation, drawn from one counter so a
  value is never reused. A fill only lands if the key's generation is
  unchanged since the read started, so a slow read can never re-insert a
  superseded version. The sweep forgets generations of keys that neither
  tier holds. A failing L2 is logged and
  bypassed. The reconciliation sweep evicts anything whose version no
  longer matches the store, which bounds staleness after a missed
  invalidation.

  Registered as a commit listener: every commit evicts the mutated keys
  and their dependents from both the previous and the new payload.
*/
class CacheManager : public txn::CommitListener {
 public:
  CacheManager(std::shared_ptr<store::VersionStore> versions, std::shared_ptr<SharedCacheTier> l2, DependencyTable dependencies,
               CacheOptions options);

  std::optional<v1::EntitySnapshot> Get(const model::EntityKey& key);

  void Invalidate(const model::EntityKey& key);

  void OnCommitted(const std::vector<txn::CommittedMutation>& mutations) override;

  // One sweep; returns the number of entries evicted.
  std::size_t ReconcileOnce();

  CacheStats Stats();

  const CacheOptions& Options() const {
    return options_;
  }

 private:
  std::chrono::milliseconds L1Ttl(model::EntityType type) const;
  std::chrono::milliseconds L2Ttl(model::EntityType type) const;

  uint64_t Generation(const std::string& key);
  // Caller holds mutex_.
  uint64_t GenerationLocked(const std::string& key) const;
  void     BumpLocked(const std::string& key);
  void     Fill(const std::string& key, const v1::EntitySnapshot& snapshot, uint64_t generation, bool fill_l2);

  std::optional<v1::EntitySnapshot> ReadL2(const std::string& key);
  void                              EraseL2(const std::string& key);

  std::shared_ptr<store::VersionStore> versions_;
  std::shared_ptr<SharedCacheTier>     l2_;
  DependencyTable                      dependencies_;
  CacheOptions                         options_;
  LocalCache                           l1_;

  std::mutex                                mutex_;
  std::unordered_map<std::string, uint64_t> generations_;
  uint64_t                                  epoch_     = 0;
  uint64_t                                  pruned_at_ = 0;
  CacheStats                                stats_;
};

} // namespace statecore::cache
