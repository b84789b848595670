#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/model/entity_key.hpp"
#include "internal/store/event_log.hpp"
#include "internal/store/version_store.hpp"
#include "internal/txn/transaction_manager.hpp"

namespace statecore::rollback {

// Exactly one of version / time_ms is set.
struct RollbackTarget {
  std::optional<uint64_t> version;
  std::optional<uint64_t> time_ms;

  static RollbackTarget Version(uint64_t v) {
    return {v, std::nullopt};
  }
  static RollbackTarget AtTime(uint64_t ms) {
    return {std::nullopt, ms};
  }
};

struct RollbackResult {
  txn::Status status;
  uint64_t    new_version    = 0;
  uint64_t    source_version = 0;
};

/*
  RollbackCoordinator

  Restores an entity to an earlier payload by committing a new version,
  never by rewriting history. The write runs in a pessimistic transaction
  holding the entity's lock, which also excludes optimistic writers.
*/
class RollbackCoordinator {
 public:
  RollbackCoordinator(std::shared_ptr<txn::TransactionManager> transactions, std::shared_ptr<store::VersionStore> versions,
                      std::shared_ptr<store::EventLog> events);

  RollbackResult RollbackTo(const model::EntityKey& key, const RollbackTarget& target, const std::string& reason,
                            const std::string& actor);

 private:
  struct Source {
    google::protobuf::Struct payload;
    uint64_t                 version = 0;
  };

  txn::Status Resolve(const model::EntityKey& key, const RollbackTarget& target, Source& out);

  std::shared_ptr<txn::TransactionManager> transactions_;
  std::shared_ptr<store::VersionStore>     versions_;
  std::shared_ptr<store::EventLog>         events_;
};

} // namespace statecore::rollback
