#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace statecore::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, bool read_only) : db_(std::move(db)), read_only_(read_only) {
  db_->Exec(read_only_ ? "BEGIN DEFERRED;" : "BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      STATECORE_LOG_WARN("sqlite rollback in destructor failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (const SqliteError& e) {
    throw CommitFailed(std::string("sqlite commit failed: ") + e.what(), false);
  }
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace statecore::db::sqlite
