#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace statecore::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqlitePool> pool);

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
  std::shared_ptr<SqlitePool> pool_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
