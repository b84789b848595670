#include "migrations.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace statecore::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  executor.EnsureMigrationTable();

  const uint64_t applied = executor.AppliedVersion();
  for (uint64_t version = applied + 1; version <= ordered_sql.size(); ++version) {
    executor.ExecuteSQL(ordered_sql[version - 1]);
    executor.RecordVersion(version, util::ToUnixMillis(util::Now()));
    STATECORE_LOG_INFO("applied schema migration", {observability::IntField("version", static_cast<int64_t>(version))});
  }
}

} // namespace statecore::db::sql
