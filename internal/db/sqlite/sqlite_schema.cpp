#include "sqlite_schema.hpp"

#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"

namespace statecore::db::sqlite {

namespace {

const std::vector<std::string> kMigrations = {
    // 1: version store, current-version index, event log
    "CREATE TABLE IF NOT EXISTS entity_versions ("
    " entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, version INTEGER NOT NULL,"
    " payload TEXT NOT NULL, event_type TEXT NOT NULL, actor TEXT NOT NULL,"
    " committed_at_ms INTEGER NOT NULL, size_bytes INTEGER NOT NULL, status TEXT NOT NULL DEFAULT '',"
    " PRIMARY KEY (entity_type, entity_id, version));"
    "CREATE INDEX IF NOT EXISTS entity_versions_time ON entity_versions(entity_type, entity_id, committed_at_ms);"
    "CREATE TABLE IF NOT EXISTS entity_current ("
    " entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, version INTEGER NOT NULL,"
    " status TEXT NOT NULL DEFAULT '', committed_at_ms INTEGER NOT NULL,"
    " PRIMARY KEY (entity_type, entity_id));"
    "CREATE TABLE IF NOT EXISTS entity_events ("
    " event_id TEXT NOT NULL UNIQUE, entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, version INTEGER NOT NULL,"
    " event_type TEXT NOT NULL, delta TEXT NOT NULL, metadata TEXT NOT NULL, actor TEXT NOT NULL,"
    " committed_at_ms INTEGER NOT NULL,"
    " PRIMARY KEY (entity_type, entity_id, version));",
};

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void EnsureMigrationTable() override {
    db_.Exec("CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);");
  }

  uint64_t AppliedVersion() override {
    sqlite3_stmt* st = db_.Prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
    uint64_t      v  = 0;
    if (sqlite3_step(st) == SQLITE_ROW) v = static_cast<uint64_t>(sqlite3_column_int64(st, 0));
    sqlite3_finalize(st);
    return v;
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  void RecordVersion(uint64_t version, uint64_t applied_at_ms) override {
    db_.Exec("INSERT INTO schema_migrations(version, applied_at_ms) VALUES(" + std::to_string(version) + "," +
             std::to_string(applied_at_ms) + ");");
  }

 private:
  SqliteDB& db_;
};

} // namespace

void BootstrapSchema(SqliteDB& db) {
  db.Exec("BEGIN IMMEDIATE;");
  try {
    SqliteMigrationExecutor executor(db);
    sql::RunMigrations(executor, kMigrations);
    db.Exec("COMMIT;");
  } catch (...) {
    db.Exec("ROLLBACK;");
    throw;
  }
}

} // namespace statecore::db::sqlite
