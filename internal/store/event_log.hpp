#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "fold.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/entity_key.hpp"
#include "statecore/v1/event.pb.h"

namespace statecore::store {

// Payload reconstructed by folding the log, with the last folded version.
struct Reconstruction {
  Payload  payload;
  uint64_t version         = 0;
  uint64_t committed_at_ms = 0;
};

/*
  EventLog

  Immutable, per-entity ordered record of state changes. Appends happen only
  inside the Transaction Manager's commit transaction.
*/
class EventLog {
 public:
  explicit EventLog(std::shared_ptr<db::Repository> repository);

  // Assigns event_id when empty. The event must be the next version of its entity.
  db::Result Append(db::Transaction& tx, v1::StateChangeEvent& event);

  // Events with version <= up_to_version (all when omitted), ascending.
  std::vector<v1::StateChangeEvent> List(const model::EntityKey& key, std::optional<uint64_t> up_to_version = std::nullopt);

  // Events with from_version <= version <= to_version.
  std::vector<v1::StateChangeEvent> ListRange(const model::EntityKey& key, uint64_t from_version, std::optional<uint64_t> to_version);

  std::vector<v1::StateChangeEvent> ListByTime(const model::EntityKey& key, uint64_t from_ms, std::optional<uint64_t> to_ms);

  // Folds versions 1..up_to_version. nullopt when no event qualifies.
  std::optional<Reconstruction> Reconstruct(const model::EntityKey& key, std::optional<uint64_t> up_to_version = std::nullopt);

  // Folds every event committed at or before at_ms.
  std::optional<Reconstruction> ReconstructAtTime(const model::EntityKey& key, uint64_t at_ms);

 private:
  static std::optional<Reconstruction> FoldAll(const std::vector<v1::StateChangeEvent>& events);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace statecore::store
