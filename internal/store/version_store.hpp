#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/entity_key.hpp"
#include "statecore/v1/entity.pb.h"

namespace statecore::store {

/*
  VersionStore

  Append-only entity snapshots keyed by (entity_type, entity_id, version),
  plus the current-version index.

  The plain read methods run in their own read-only repository transaction.
  The overloads taking db::Transaction& are for the Transaction Manager's
  commit path; Put is only ever called from there.
*/
class VersionStore {
 public:
  explicit VersionStore(std::shared_ptr<db::Repository> repository);

  // version omitted means latest
  std::optional<v1::EntitySnapshot> Get(const model::EntityKey& key, std::optional<uint64_t> version = std::nullopt);

  // Snapshot with the greatest committed_at <= at_ms.
  std::optional<v1::EntitySnapshot> GetAtTime(const model::EntityKey& key, uint64_t at_ms);

  std::optional<uint64_t> CurrentVersion(const model::EntityKey& key);

  // Every version ascending, without payloads.
  std::vector<v1::VersionInfo> History(const model::EntityKey& key);

  std::vector<v1::EntitySnapshot> ListCurrent(model::EntityType type, const db::Pagination& pagination, bool include_deleted);

  // ---------------------------------------------------------------------
  // Commit path
  // ---------------------------------------------------------------------

  std::optional<v1::EntitySnapshot> Get(db::Transaction& tx, const model::EntityKey& key, std::optional<uint64_t> version = std::nullopt);

  std::optional<db::model::EntityHeadRecord> Current(db::Transaction& tx, const model::EntityKey& key);

  /*
    Appends a snapshot. The version must be current+1.
    A version at or below current means a concurrent writer won and is
    returned as ConstraintViolation; a gap throws util::ConflictError.
  */
  db::Result Put(db::Transaction& tx, const v1::EntitySnapshot& snapshot);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace statecore::store
