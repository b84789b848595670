#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace statecore::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginReadOnly() override;

  Result InsertSnapshot(Transaction&, const model::SnapshotRecord&) override;
  std::optional<model::SnapshotRecord> GetSnapshot(Transaction&, const std::string& entity_type, const std::string& entity_id,
                                                   uint64_t version) override;
  std::optional<model::SnapshotRecord> GetLatestSnapshot(Transaction&, const std::string& entity_type,
                                                         const std::string& entity_id) override;
  std::optional<model::SnapshotRecord> GetSnapshotAtTime(Transaction&, const std::string& entity_type, const std::string& entity_id,
                                                         uint64_t at_ms) override;
  std::optional<model::EntityHeadRecord> GetCurrent(Transaction&, const std::string& entity_type, const std::string& entity_id) override;
  std::vector<model::SnapshotRecord> ListVersions(Transaction&, const std::string& entity_type, const std::string& entity_id) override;
  std::vector<model::SnapshotRecord> ListCurrent(Transaction&, const std::string& entity_type, const Pagination& pagination,
                                                 bool include_deleted) override;

  Result AppendEvent(Transaction&, const model::EventRecord&) override;
  std::vector<model::EventRecord> ListEvents(Transaction&, const std::string& entity_type, const std::string& entity_id,
                                             uint64_t from_version, std::optional<uint64_t> to_version) override;
  std::vector<model::EventRecord> ListEventsByTime(Transaction&, const std::string& entity_type, const std::string& entity_id,
                                                   uint64_t from_ms, std::optional<uint64_t> to_ms) override;

private:
  friend class MemoryTransaction;

  // Versions and events of one entity, both ascending by version.
  struct History {
    std::vector<model::SnapshotRecord> versions;
    std::vector<model::EventRecord>    events;
  };

  // entity_type -> entity_id -> history. Ordered so listings are stable.
  using State = std::map<std::string, std::map<std::string, History>>;

  // Committed history of one entity overlaid with the transaction's pending writes.
  History View(Transaction& t, const std::string& entity_type, const std::string& entity_id);

  // Point lookups over the same overlay; they copy at most one row.
  std::optional<model::SnapshotRecord> FindSnapshot(Transaction& t, const std::string& entity_type, const std::string& entity_id,
                                                    std::optional<uint64_t> version);
  bool HasEvent(Transaction& t, const std::string& entity_type, const std::string& entity_id, uint64_t version);

  // Caller holds mutex_.
  const History* CommittedLocked(const std::string& entity_type, const std::string& entity_id) const;

  std::mutex mutex_;
  State committed_;
};

}
