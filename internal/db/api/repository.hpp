#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/snapshot_record.hpp"

namespace statecore::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - (entity_type, entity_id, version) is unique for snapshots and for events;
    a duplicate insert fails with ConstraintViolation (or the commit fails
    with CommitFailed{conflict=true} on backends that defer the check)
  - InsertSnapshot also advances the current-version index

  The DB is the source of truth for:
    entity versions
    the event log
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Read-only transaction; writes through it are rejected.
  virtual std::unique_ptr<Transaction> BeginReadOnly() = 0;

  // ---------------------------------------------------------------------
  // Version store
  // ---------------------------------------------------------------------

  virtual Result InsertSnapshot(Transaction&, const model::SnapshotRecord&) = 0;

  virtual std::optional<model::SnapshotRecord> GetSnapshot(Transaction&, const std::string& entity_type, const std::string& entity_id,
                                                           uint64_t version) = 0;

  virtual std::optional<model::SnapshotRecord> GetLatestSnapshot(Transaction&, const std::string& entity_type, const std::string& entity_id) = 0;

  // Latest snapshot with committed_at_ms <= at_ms.
  virtual std::optional<model::SnapshotRecord> GetSnapshotAtTime(Transaction&, const std::string& entity_type, const std::string& entity_id,
                                                                 uint64_t at_ms) = 0;

  virtual std::optional<model::EntityHeadRecord> GetCurrent(Transaction&, const std::string& entity_type, const std::string& entity_id) = 0;

  // All versions ascending; payload is left empty.
  virtual std::vector<model::SnapshotRecord> ListVersions(Transaction&, const std::string& entity_type, const std::string& entity_id) = 0;

  // Current snapshot of each entity of a type, ordered by entity_id.
  virtual std::vector<model::SnapshotRecord> ListCurrent(Transaction&, const std::string& entity_type, const Pagination& pagination,
                                                         bool include_deleted) = 0;

  // ---------------------------------------------------------------------
  // Event log
  // ---------------------------------------------------------------------

  virtual Result AppendEvent(Transaction&, const model::EventRecord&) = 0;

  // Events with from_version <= version <= to_version, ascending.
  virtual std::vector<model::EventRecord> ListEvents(Transaction&, const std::string& entity_type, const std::string& entity_id,
                                                     uint64_t from_version, std::optional<uint64_t> to_version) = 0;

  // Events with from_ms <= committed_at_ms <= to_ms, ascending by version.
  virtual std::vector<model::EventRecord> ListEventsByTime(Transaction&, const std::string& entity_type, const std::string& entity_id,
                                                           uint64_t from_ms, std::optional<uint64_t> to_ms) = 0;
};

} // namespace statecore::db
