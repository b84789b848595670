#include "pg_tx.hpp"

#include <string>

#include "internal/observability/logging.hpp"

namespace statecore::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, bool read_only, std::chrono::milliseconds statement_timeout)
    : read_only_(read_only) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
  if (read_only_) tx_->exec("SET TRANSACTION READ ONLY");
  tx_->exec("SET LOCAL statement_timeout = " + std::to_string(statement_timeout.count()));
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      STATECORE_LOG_WARN("postgres abort in destructor failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  finished_ = true;
  try {
    tx_->commit();
  } catch (const pqxx::unique_violation& e) {
    throw CommitFailed(std::string("postgres commit conflict: ") + e.what(), true);
  } catch (const pqxx::serialization_failure& e) {
    throw CommitFailed(std::string("postgres commit conflict: ") + e.what(), true);
  } catch (const std::exception& e) {
    // in_doubt_error and broken connections land here: outcome unknown.
    throw CommitFailed(std::string("postgres commit failed: ") + e.what(), false);
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

} // namespace statecore::db::postgres
