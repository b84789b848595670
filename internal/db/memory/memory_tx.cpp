#include "memory_tx.hpp"

#include <algorithm>
#include <string>

namespace statecore::db::memory {

namespace {

template <typename Row>
bool SameEntity(const Row& a, const Row& b) {
  return a.entity_type == b.entity_type && a.entity_id == b.entity_id;
}

// Pending rows must continue the committed sequence without gaps or duplicates.
template <typename Row>
bool Continues(const std::vector<Row>& committed, const std::vector<Row>& pending, const Row& row) {
  uint64_t last = committed.empty() ? 0 : committed.back().version;
  for (const auto& p : pending) {
    if (&p == &row) break;
    if (SameEntity(p, row)) last = p.version;
  }
  return row.version == last + 1;
}

} // namespace

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, bool read_only) : repo_(repo), read_only_(read_only) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw CommitFailed("memory transaction already finished", false);
  }

  std::scoped_lock lock(repo_.mutex_);

  // Validate everything before touching committed state.
  for (const auto& s : snapshots_) {
    auto& history = repo_.committed_[s.entity_type][s.entity_id];
    if (!Continues(history.versions, snapshots_, s)) {
      throw CommitFailed("transaction conflict: " + s.entity_type + ":" + s.entity_id + " version " + std::to_string(s.version) +
                             " was committed concurrently",
                         true);
    }
  }
  for (const auto& e : events_) {
    auto& history = repo_.committed_[e.entity_type][e.entity_id];
    if (!Continues(history.events, events_, e)) {
      throw CommitFailed("transaction conflict: event " + e.entity_type + ":" + e.entity_id + " version " + std::to_string(e.version) +
                             " was appended concurrently",
                         true);
    }
  }

  for (auto& s : snapshots_) {
    repo_.committed_[s.entity_type][s.entity_id].versions.push_back(std::move(s));
  }
  for (auto& e : events_) {
    repo_.committed_[e.entity_type][e.entity_id].events.push_back(std::move(e));
  }
  snapshots_.clear();
  events_.clear();
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  snapshots_.clear();
  events_.clear();
  rolled_back_ = true;
}

} // namespace statecore::db::memory
