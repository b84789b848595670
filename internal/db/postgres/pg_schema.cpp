#include "pg_schema.hpp"

#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"

namespace statecore::db::postgres {

namespace {

const std::vector<std::string> kMigrations = {
    // 1: version store, current-version index, event log
    "CREATE TABLE IF NOT EXISTS entity_versions ("
    " entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, version BIGINT NOT NULL,"
    " payload JSONB NOT NULL, event_type TEXT NOT NULL, actor TEXT NOT NULL,"
    " committed_at_ms BIGINT NOT NULL, size_bytes BIGINT NOT NULL, status TEXT NOT NULL DEFAULT '',"
    " PRIMARY KEY (entity_type, entity_id, version));"
    "CREATE INDEX IF NOT EXISTS entity_versions_time ON entity_versions(entity_type, entity_id, committed_at_ms);"
    "CREATE TABLE IF NOT EXISTS entity_current ("
    " entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, version BIGINT NOT NULL,"
    " status TEXT NOT NULL DEFAULT '', committed_at_ms BIGINT NOT NULL,"
    " PRIMARY KEY (entity_type, entity_id));"
    "CREATE TABLE IF NOT EXISTS entity_events ("
    " event_id TEXT NOT NULL UNIQUE, entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, version BIGINT NOT NULL,"
    " event_type TEXT NOT NULL, delta JSONB NOT NULL, metadata JSONB NOT NULL, actor TEXT NOT NULL,"
    " committed_at_ms BIGINT NOT NULL,"
    " PRIMARY KEY (entity_type, entity_id, version));",
};

class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void EnsureMigrationTable() override {
    tx_.exec("CREATE TABLE IF NOT EXISTS schema_migrations (version BIGINT PRIMARY KEY, applied_at_ms BIGINT NOT NULL);");
  }

  uint64_t AppliedVersion() override {
    auto res = tx_.exec("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
    return res[0][0].as<uint64_t>();
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

  void RecordVersion(uint64_t version, uint64_t applied_at_ms) override {
    tx_.exec_params("INSERT INTO schema_migrations(version, applied_at_ms) VALUES($1,$2);", version, applied_at_ms);
  }

 private:
  pqxx::work& tx_;
};

} // namespace

void BootstrapSchema(const std::shared_ptr<PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  // serialize concurrent bootstraps from several processes
  tx.exec("SELECT pg_advisory_xact_lock(7412001);");

  PgMigrationExecutor executor(tx);
  sql::RunMigrations(executor, kMigrations);
  tx.commit();
}

} // namespace statecore::db::postgres
