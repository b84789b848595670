#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/cache/cache_manager.hpp"
#include "internal/events/event_publisher.hpp"
#include "internal/lock/lock_manager.hpp"
#include "internal/rollback/rollback_coordinator.hpp"
#include "internal/store/event_log.hpp"
#include "internal/store/version_store.hpp"
#include "internal/txn/transaction_manager.hpp"
#include "statecore/v1.hpp"

namespace statecore::core {

/*
  StateManager

  Inbound surface used by workflow engines, agent handlers and schedulers.

  Writes go through transactions. Current-state reads use the cache read
  path; historical reads go straight to the Version Store and Event Log.
  Absent entities or versions throw util::NotFound.
*/
class StateManager {
 public:
  StateManager(std::shared_ptr<txn::TransactionManager> transactions, std::shared_ptr<store::VersionStore> versions,
               std::shared_ptr<store::EventLog> events, std::shared_ptr<cache::CacheManager> cache,
               std::shared_ptr<rollback::RollbackCoordinator> rollback, std::shared_ptr<events::EventPublisher> publisher,
               std::shared_ptr<lock::LockManager> locks);

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  std::unique_ptr<txn::Transaction> BeginTransaction(txn::Mode mode, std::string actor = {});
  txn::CommitResult                 Commit(txn::Transaction& txn);
  void                              Abort(txn::Transaction& txn);

  txn::CommitResult RunWithRetry(txn::Mode mode, const std::function<txn::Status(txn::Transaction&)>& body,
                                 const txn::RetryPolicy& policy = {}, std::string actor = {});

  // ---------------------------------------------------------------------
  // Reads
  // ---------------------------------------------------------------------

  v1::EntitySnapshot GetEntity(const model::EntityKey& key);
  v1::EntitySnapshot GetEntityAtVersion(const model::EntityKey& key, uint64_t version);
  v1::EntitySnapshot GetEntityAtTime(const model::EntityKey& key, uint64_t at_ms);

  std::vector<v1::VersionInfo> GetHistory(const model::EntityKey& key);

  std::vector<v1::StateChangeEvent> GetEvents(const model::EntityKey& key, uint64_t from_version = 1,
                                              std::optional<uint64_t> to_version = std::nullopt);
  std::vector<v1::StateChangeEvent> GetEventsByTime(const model::EntityKey& key, uint64_t from_ms,
                                                    std::optional<uint64_t> to_ms = std::nullopt);

  store::Reconstruction ReconstructFromEvents(const model::EntityKey& key, std::optional<uint64_t> up_to_version = std::nullopt);

  std::vector<v1::EntitySnapshot> ListEntities(model::EntityType type, const db::Pagination& pagination = {},
                                               bool include_deleted = false);

  // ---------------------------------------------------------------------
  // Rollback, stream, locks
  // ---------------------------------------------------------------------

  rollback::RollbackResult RollbackTo(const model::EntityKey& key, const rollback::RollbackTarget& target, const std::string& reason,
                                      const std::string& actor);

  uint64_t Subscribe(events::Subscriber subscriber);
  void     Unsubscribe(uint64_t id);

  std::optional<lock::LockRecord> InspectLock(const std::string& key);

  // Holder heartbeat for a long pessimistic transaction.
  std::size_t RefreshLocks(const txn::Transaction& txn, std::optional<std::chrono::milliseconds> lease = std::nullopt);

  cache::CacheStats CacheStats();

 private:
  std::shared_ptr<txn::TransactionManager>       transactions_;
  std::shared_ptr<store::VersionStore>           versions_;
  std::shared_ptr<store::EventLog>               events_;
  std::shared_ptr<cache::CacheManager>           cache_;
  std::shared_ptr<rollback::RollbackCoordinator> rollback_;
  std::shared_ptr<events::EventPublisher>        publisher_;
  std::shared_ptr<lock::LockManager>             locks_;
};

} // namespace statecore::core
