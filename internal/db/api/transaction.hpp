#pragma once

#include <stdexcept>
#include <string>

namespace statecore::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws CommitFailed; the caller must treat the
    outcome as unknown unless the exception says otherwise

  SQLite: BEGIN IMMEDIATE (writes) / BEGIN DEFERRED (reads)
  Postgres: pqxx::work
  Memory: write set applied under the repository mutex
*/

class CommitFailed : public std::runtime_error {
 public:
  // `conflict` is true when the backend rejected the commit before applying
  // anything because a concurrent writer got there first.
  CommitFailed(const std::string& msg, bool conflict) : std::runtime_error(msg), conflict_(conflict) {
  }

  bool IsConflict() const {
    return conflict_;
  }

 private:
  bool conflict_;
};

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

}
