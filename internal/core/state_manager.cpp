#include "state_manager.hpp"

#include "internal/util/errors.hpp"

namespace statecore::core {

StateManager::StateManager(std::shared_ptr<txn::TransactionManager> transactions, std::shared_ptr<store::VersionStore> versions,
                           std::shared_ptr<store::EventLog> events, std::shared_ptr<cache::CacheManager> cache,
                           std::shared_ptr<rollback::RollbackCoordinator> rollback, std::shared_ptr<events::EventPublisher> publisher,
                           std::shared_ptr<lock::LockManager> locks)
    : transactions_(std::move(transactions)),
      versions_(std::move(versions)),
      events_(std::move(events)),
      cache_(std::move(cache)),
      rollback_(std::move(rollback)),
      publisher_(std::move(publisher)),
      locks_(std::move(locks)) {
}

std::unique_ptr<txn::Transaction> StateManager::BeginTransaction(txn::Mode mode, std::string actor) {
  return transactions_->Begin(mode, std::move(actor));
}

txn::CommitResult StateManager::Commit(txn::Transaction& txn) {
  return transactions_->Commit(txn);
}

void StateManager::Abort(txn::Transaction& txn) {
  transactions_->Abort(txn);
}

txn::CommitResult StateManager::RunWithRetry(txn::Mode mode, const std::function<txn::Status(txn::Transaction&)>& body,
                                             const txn::RetryPolicy& policy, std::string actor) {
  return transactions_->RunWithRetry(mode, body, policy, std::move(actor));
}

v1::EntitySnapshot StateManager::GetEntity(const model::EntityKey& key) {
  auto snapshot = cache_ ? cache_->Get(key) : versions_->Get(key);
  if (!snapshot) throw util::NotFound("entity not found: " + model::KeyString(key));
  return *snapshot;
}

v1::EntitySnapshot StateManager::GetEntityAtVersion(const model::EntityKey& key, uint64_t version) {
  auto snapshot = versions_->Get(key, version);
  if (!snapshot) throw util::NotFound("version " + std::to_string(version) + " not found: " + model::KeyString(key));
  return *snapshot;
}

v1::EntitySnapshot StateManager::GetEntityAtTime(const model::EntityKey& key, uint64_t at_ms) {
  auto snapshot = versions_->GetAtTime(key, at_ms);
  if (!snapshot) throw util::NotFound("no version at " + std::to_string(at_ms) + ": " + model::KeyString(key));
  return *snapshot;
}

std::vector<v1::VersionInfo> StateManager::GetHistory(const model::EntityKey& key) {
  auto history = versions_->History(key);
  if (history.empty()) throw util::NotFound("entity not found: " + model::KeyString(key));
  return history;
}

std::vector<v1::StateChangeEvent> StateManager::GetEvents(const model::EntityKey& key, uint64_t from_version,
                                                          std::optional<uint64_t> to_version) {
  return events_->ListRange(key, from_version, to_version);
}

std::vector<v1::StateChangeEvent> StateManager::GetEventsByTime(const model::EntityKey& key, uint64_t from_ms, std::optional<uint64_t> to_ms) {
  return events_->ListByTime(key, from_ms, to_ms);
}

store::Reconstruction StateManager::ReconstructFromEvents(const model::EntityKey& key, std::optional<uint64_t> up_to_version) {
  auto state = events_->Reconstruct(key, up_to_version);
  if (!state) throw util::NotFound("no events for " + model::KeyString(key));
  return std::move(*state);
}

std::vector<v1::EntitySnapshot> StateManager::ListEntities(model::EntityType type, const db::Pagination& pagination, bool include_deleted) {
  return versions_->ListCurrent(type, pagination, include_deleted);
}

rollback::RollbackResult StateManager::RollbackTo(const model::EntityKey& key, const rollback::RollbackTarget& target, const std::string& reason,
                                                  const std::string& actor) {
  return rollback_->RollbackTo(key, target, reason, actor);
}

uint64_t StateManager::Subscribe(events::Subscriber subscriber) {
  return publisher_->Subscribe(std::move(subscriber));
}

void StateManager::Unsubscribe(uint64_t id) {
  publisher_->Unsubscribe(id);
}

std::optional<lock::LockRecord> StateManager::InspectLock(const std::string& key) {
  return locks_->Inspect(key);
}

std::size_t StateManager::RefreshLocks(const txn::Transaction& txn, std::optional<std::chrono::milliseconds> lease) {
  return locks_->Refresh(txn.Id(), lease.value_or(locks_->Defaults().lease));
}

cache::CacheStats StateManager::CacheStats() {
  return cache_ ? cache_->Stats() : cache::CacheStats{};
}

} // namespace statecore::core
