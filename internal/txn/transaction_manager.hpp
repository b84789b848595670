#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "commit_listener.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/lock/lock_manager.hpp"
#include "internal/store/event_log.hpp"
#include "internal/store/version_store.hpp"
#include "transaction.hpp"

namespace statecore::txn {

struct CommitResult {
  Status                                           status;
  std::vector<std::pair<model::EntityKey, uint64_t>> committed;
};

struct RetryPolicy {
  int                       max_attempts = 5;
  std::chrono::milliseconds base_backoff{10};
  std::chrono::milliseconds max_backoff{1000};
};

/*
  TransactionManager

  The only writer of the Version Store and the Event Log. Commit runs as a
  single backing-store transaction:

    1. confirm lock ownership (pessimistic) or take fail-fast locks on the
       written keys (optimistic); a key locked by another transaction is an
       optimistic conflict
    2. re-validate every observed version against the current-version index
    3. append one event and one snapshot per written entity, in key order
    4. commit the backing-store transaction
    5. notify listeners (cache invalidation, outbound events)
    6. release locks

  Steps 2-4 are all-or-nothing across every entity of the transaction.
*/
class TransactionManager {
 public:
  TransactionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<store::VersionStore> versions,
                     std::shared_ptr<store::EventLog> events, std::shared_ptr<lock::LockManager> locks);

  // Register before the first commit.
  void AddListener(std::shared_ptr<CommitListener> listener);

  std::unique_ptr<Transaction> Begin(Mode mode, std::string actor = {});

  // Throws util::InvalidState if the handle already finished.
  CommitResult Commit(Transaction& txn);

  // Always succeeds. No-op on a finished handle.
  void Abort(Transaction& txn);

  /*
    Runs body in a fresh transaction and commits it, retrying with full-jitter
    exponential backoff while the outcome is retryable. A non-ok status from
    body aborts the attempt.
  */
  CommitResult RunWithRetry(Mode mode, const std::function<Status(Transaction&)>& body, const RetryPolicy& policy = {},
                            std::string actor = {});

  lock::LockManager& Locks() {
    return *locks_;
  }

 private:
  friend class Transaction;

  Status Validate(Transaction& txn);
  Status CheckVersions(Transaction& txn, db::Transaction& tx);
  Status WriteAll(Transaction& txn, db::Transaction& tx, std::vector<CommittedMutation>& mutations);
  void   Notify(const std::vector<CommittedMutation>& mutations);
  void   Finish(Transaction& txn);

  std::shared_ptr<db::Repository>              repository_;
  std::shared_ptr<store::VersionStore>         versions_;
  std::shared_ptr<store::EventLog>             events_;
  std::shared_ptr<lock::LockManager>           locks_;
  std::vector<std::shared_ptr<CommitListener>> listeners_;
};

} // namespace statecore::txn
