#pragma once

#include <chrono>
#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace statecore::db::postgres {

/*
  One pqxx::work on a pooled connection.

  statement_timeout is set per transaction to the commit timeout, so a
  blocked insert or COMMIT fails instead of hanging.
*/
class PgTransaction final : public db::Transaction {
public:
  PgTransaction(std::shared_ptr<PgPool> pool, bool read_only, std::chrono::milliseconds statement_timeout);
  ~PgTransaction();

  pqxx::work& Work() { return *tx_; }
  bool IsReadOnly() const { return read_only_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  bool read_only_;
  bool committed_ = false;
  bool finished_ = false;
};

}
