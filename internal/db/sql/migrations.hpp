#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace statecore::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements the executor over its own connection.
  Migration i (0-based) in the ordered list is schema version i+1.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  // Creates schema_migrations if missing.
  virtual void EnsureMigrationTable() = 0;

  // Highest applied schema version, 0 when none.
  virtual uint64_t AppliedVersion() = 0;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  virtual void RecordVersion(uint64_t version, uint64_t applied_at_ms) = 0;
};

/*
  Runs pending migrations in order. Idempotent: already applied versions
  are skipped.
*/
void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace statecore::db::sql
