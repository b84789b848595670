#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace statecore::db::sqlite {

/*
  SQLite transaction wrapper.

  Writers use BEGIN IMMEDIATE:
    - grabs write lock early
    - a second writer waits busy_timeout, then fails
  Readers use BEGIN DEFERRED and never take the write lock.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, bool read_only);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }
  bool IsReadOnly() const { return read_only_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool read_only_;
  bool committed_ = false;
  bool finished_ = false;
};

}
