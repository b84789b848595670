#pragma once

#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace statecore::db::memory {

/*
  Transaction = committed view + write set

  Writes are buffered here and applied to the repository atomically on
  Commit(). Commit re-checks every pending version against the committed
  state and fails with CommitFailed{conflict=true} if a concurrent
  transaction already advanced the same entity.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, bool read_only);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  bool IsReadOnly() const {
    return read_only_;
  }

  std::vector<model::SnapshotRecord>& PendingSnapshots() {
    return snapshots_;
  }
  std::vector<model::EventRecord>& PendingEvents() {
    return events_;
  }

 private:
  MemoryRepository&                  repo_;
  bool                               read_only_;
  std::vector<model::SnapshotRecord> snapshots_;
  std::vector<model::EventRecord>    events_;
  bool                               committed_   = false;
  bool                               rolled_back_ = false;
};

} // namespace statecore::db::memory
