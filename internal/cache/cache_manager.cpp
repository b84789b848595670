#include "cache_manager.hpp"

#include <set>
#include <unordered_set>

#include "internal/observability/logging.hpp"

namespace statecore::cache {

namespace {

using observability::IntField;
using observability::StringField;

} // namespace

CacheOptions CacheOptions::WithDefaults() {
  using std::chrono::seconds;

  CacheOptions options;
  options.l1_type_ttl[statecore::v1::ENTITY_TYPE_TASK]     = seconds(180);
  options.l1_type_ttl[statecore::v1::ENTITY_TYPE_SYSTEM]   = seconds(600);
  options.l2_type_ttl[statecore::v1::ENTITY_TYPE_TASK]     = seconds(900);
  options.l2_type_ttl[statecore::v1::ENTITY_TYPE_AGENT]    = seconds(1800);
  options.l2_type_ttl[statecore::v1::ENTITY_TYPE_RESOURCE] = seconds(1800);
  return options;
}

CacheManager::CacheManager(std::shared_ptr<store::VersionStore> versions, std::shared_ptr<SharedCacheTier> l2, DependencyTable dependencies,
                           CacheOptions options)
    : versions_(std::move(versions)),
      l2_(std::move(l2)),
      dependencies_(std::move(dependencies)),
      options_(std::move(options)),
      l1_(options_.l1_max_entries) {
}

std::chrono::milliseconds CacheManager::L1Ttl(model::EntityType type) const {
  auto it = options_.l1_type_ttl.find(type);
  return it == options_.l1_type_ttl.end() ? options_.l1_ttl : it->second;
}

std::chrono::milliseconds CacheManager::L2Ttl(model::EntityType type) const {
  auto it = options_.l2_type_ttl.find(type);
  return it == options_.l2_type_ttl.end() ? options_.l2_ttl : it->second;
}

uint64_t CacheManager::GenerationLocked(const std::string& key) const {
  auto it = generations_.find(key);
  return it == generations_.end() ? pruned_at_ : it->second;
}

void CacheManager::BumpLocked(const std::string& key) {
  generations_[key] = ++epoch_;
}

uint64_t CacheManager::Generation(const std::string& key) {
  std::lock_guard lock(mutex_);
  return GenerationLocked(key);
}

std::optional<v1::EntitySnapshot> CacheManager::Get(const model::EntityKey& key) {
  const auto name = model::KeyString(key);

  if (auto hit = l1_.Get(name)) {
    std::lock_guard lock(mutex_);
    ++stats_.l1.hits;
    return hit;
  }

  {
    std::lock_guard lock(mutex_);
    ++stats_.l1.misses;
  }

  const auto generation = Generation(name);

  if (l2_) {
    if (auto hit = ReadL2(name)) {
      Fill(name, *hit, generation, false);
      return hit;
    }
  }

  auto snapshot = versions_->Get(key);
  {
    std::lock_guard lock(mutex_);
    ++stats_.store_reads;
  }
  if (!snapshot) return std::nullopt;

  Fill(name, *snapshot, generation, l2_ != nullptr);
  return snapshot;
}

void CacheManager::Fill(const std::string& key, const v1::EntitySnapshot& snapshot, uint64_t generation, bool fill_l2) {
  {
    std::lock_guard lock(mutex_);
    if (GenerationLocked(key) != generation) {
      ++stats_.stale_fills_skipped;
      return;
    }
    l1_.Put(key, snapshot, L1Ttl(snapshot.key().type()));
  }

  if (!fill_l2) return;

  try {
    l2_->Put(key, snapshot.SerializeAsString(), L2Ttl(snapshot.key().type()));
  } catch (const std::exception& e) {
    {
      std::lock_guard lock(mutex_);
      ++stats_.l2.errors;
    }
    STATECORE_LOG_WARN("shared cache put failed", {StringField("key", key), StringField("error", e.what())});
    return;
  }

  // An invalidation may have raced the L2 put.
  if (Generation(key) != generation) EraseL2(key);
}

std::optional<v1::EntitySnapshot> CacheManager::ReadL2(const std::string& key) {
  std::optional<std::string> value;
  try {
    value = l2_->Get(key);
  } catch (const std::exception& e) {
    {
      std::lock_guard lock(mutex_);
      ++stats_.l2.errors;
    }
    STATECORE_LOG_WARN("shared cache unavailable, reading version store", {StringField("key", key), StringField("error", e.what())});
    return std::nullopt;
  }

  std::lock_guard lock(mutex_);
  if (!value) {
    ++stats_.l2.misses;
    return std::nullopt;
  }

  v1::EntitySnapshot snapshot;
  if (!snapshot.ParseFromString(*value)) {
    ++stats_.l2.errors;
    return std::nullopt;
  }
  ++stats_.l2.hits;
  return snapshot;
}

void CacheManager::EraseL2(const std::string& key) {
  if (!l2_) return;
  try {
    l2_->Erase(key);
  } catch (const std::exception& e) {
    {
      std::lock_guard lock(mutex_);
      ++stats_.l2.errors;
    }
    // The reconciliation sweep removes the entry once the tier is back.
    STATECORE_LOG_WARN("shared cache erase failed", {StringField("key", key), StringField("error", e.what())});
  }
}

void CacheManager::Invalidate(const model::EntityKey& key) {
  const auto name = model::KeyString(key);
  {
    std::lock_guard lock(mutex_);
    BumpLocked(name);
    ++stats_.invalidations;
    l1_.Erase(name);
  }
  EraseL2(name);
}

void CacheManager::OnCommitted(const std::vector<txn::CommittedMutation>& mutations) {
  std::set<std::string>         seen;
  std::vector<model::EntityKey> keys;

  auto add = [&](const model::EntityKey& key) {
    if (seen.insert(model::KeyString(key)).second) keys.push_back(key);
  };

  for (const auto& m : mutations) {
    add(m.event.key());
    if (m.previous_payload) {
      for (const auto& dep : dependencies_.Dependents(m.event.key(), *m.previous_payload)) add(dep);
    }
    for (const auto& dep : dependencies_.Dependents(m.event.key(), m.payload)) add(dep);
  }

  for (const auto& key : keys) {
    Invalidate(key);
  }
}

std::size_t CacheManager::ReconcileOnce() {
  std::size_t evicted = 0;

  auto evict_l1 = [&](const std::string& name) {
    std::lock_guard lock(mutex_);
    BumpLocked(name);
    if (l1_.Erase(name)) {
      ++stats_.l1.evictions;
      ++evicted;
    }
  };

  for (const auto& [name, version] : l1_.Versions()) {
    auto key = model::ParseKeyString(name);
    if (!key) {
      evict_l1(name);
      continue;
    }
    auto current = versions_->CurrentVersion(*key);
    if (!current || *current != version) evict_l1(name);
  }

  std::unordered_set<std::string> l2_keys;
  bool                            l2_listed = l2_ == nullptr;

  if (l2_) {
    try {
      for (const auto& name : l2_->Keys()) {
        l2_keys.insert(name);
        auto key    = model::ParseKeyString(name);
        auto cached = key ? ReadL2(name) : std::nullopt;
        if (cached) {
          auto current = versions_->CurrentVersion(*key);
          if (current && *current == cached->version()) continue;
        }
        {
          std::lock_guard lock(mutex_);
          BumpLocked(name);
          ++stats_.l2.evictions;
        }
        l2_->Erase(name);
        ++evicted;
      }
      l2_listed = true;
    } catch (const std::exception& e) {
      {
        std::lock_guard lock(mutex_);
        ++stats_.l2.errors;
      }
      STATECORE_LOG_WARN("shared cache reconciliation failed", {StringField("error", e.what())});
    }
  }

  // A generation only guards fills; a key neither tier holds can start over
  // from a fresh epoch. Skipped when L2 could not be listed.
  if (l2_listed) {
    std::unordered_set<std::string> cached;
    for (const auto& [name, version] : l1_.Versions()) {
      cached.insert(name);
    }
    std::lock_guard lock(mutex_);
    // Forgotten keys read as the current epoch, which no read started
    // before a later invalidation can have observed.
    pruned_at_ = epoch_;
    for (auto it = generations_.begin(); it != generations_.end();) {
      if (cached.count(it->first) == 0 && l2_keys.count(it->first) == 0) {
        it = generations_.erase(it);
      } else {
        ++it;
      }
    }
  }

  if (evicted > 0) {
    STATECORE_LOG_INFO("cache reconciliation evicted stale entries", {IntField("evicted", static_cast<int64_t>(evicted))});
  }
  return evicted;
}

CacheStats CacheManager::Stats() {
  const uint64_t  l1_expired = l1_.Evictions();
  std::lock_guard lock(mutex_);
  CacheStats      out = stats_;
  out.l1.evictions += l1_expired;
  out.tracked_generations = generations_.size();
  return out;
}

} // namespace statecore::cache
