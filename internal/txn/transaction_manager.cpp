#include "transaction_manager.hpp"

#include <algorithm>
#include <random>
#include <thread>

#include "internal/model/lifecycle.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/fold.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace statecore::txn {

namespace {

using observability::IntField;
using observability::StringField;

Status FromDbResult(const db::Result& result, const std::string& context) {
  switch (result.code) {
    case db::ErrorCode::OK:
      return Status::Ok();
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::Conflict:
    case db::ErrorCode::ConstraintViolation:
    case db::ErrorCode::SerializationFailure:
      return {StatusCode::kOptimisticConflict, context + ": " + result.message};
    default:
      return {StatusCode::kStorageError, context + ": " + db::ToString(result.code) + " " + result.message};
  }
}

std::chrono::milliseconds Backoff(const RetryPolicy& policy, int attempt) {
  thread_local std::mt19937_64 rng{std::random_device{}()};

  auto ceiling = policy.base_backoff;
  for (int i = 1; i < attempt && ceiling < policy.max_backoff; ++i) {
    ceiling *= 2;
  }
  ceiling = std::min(ceiling, policy.max_backoff);

  std::uniform_int_distribution<int64_t> jitter(0, std::max<int64_t>(ceiling.count(), 0));
  return std::chrono::milliseconds(jitter(rng));
}

} // namespace

TransactionManager::TransactionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<store::VersionStore> versions,
                                       std::shared_ptr<store::EventLog> events, std::shared_ptr<lock::LockManager> locks)
    : repository_(std::move(repository)), versions_(std::move(versions)), events_(std::move(events)), locks_(std::move(locks)) {
}

void TransactionManager::AddListener(std::shared_ptr<CommitListener> listener) {
  listeners_.push_back(std::move(listener));
}

std::unique_ptr<Transaction> TransactionManager::Begin(Mode mode, std::string actor) {
  return std::unique_ptr<Transaction>(new Transaction(*this, util::GenerateUUIDString(), mode, std::move(actor)));
}

void TransactionManager::Abort(Transaction& txn) {
  if (!txn.active_) return;
  txn.writes_.clear();
  Finish(txn);
}

void TransactionManager::Finish(Transaction& txn) {
  txn.active_ = false;
  if (!txn.locked_keys_.empty()) {
    locks_->Release(txn.id_);
    txn.locked_keys_.clear();
  }
}

Status TransactionManager::Validate(Transaction& txn) {
  if (txn.mode_ == Mode::kPessimistic) {
    for (const auto& key : txn.locked_keys_) {
      if (locks_->Validate(txn.id_, key) != lock::LockStatus::kAcquired) {
        return {StatusCode::kLockExpired, "lock on " + key + " expired before commit"};
      }
    }
    return Status::Ok();
  }

  // Pessimistic critical sections, rollback included, exclude optimistic writers.
  // The written keys stay locked until Finish, so no lock holder can read
  // them between this check and the backing-store commit.
  if (txn.writes_.empty()) return Status::Ok();

  std::vector<std::string> keys;
  keys.reserve(txn.writes_.size());
  for (const auto& [name, write] : txn.writes_) {
    keys.push_back(name);
  }

  lock::AcquireOptions options;
  options.wait    = lock::WaitPolicy::kFailFast;
  options.timeout = std::chrono::milliseconds(0);
  options.lease   = locks_->Defaults().lease;
  options.holder  = txn.actor_;

  if (locks_->Acquire(txn.id_, keys, options) != lock::LockStatus::kAcquired) {
    return {StatusCode::kOptimisticConflict, "a written key is locked by another transaction"};
  }
  txn.locked_keys_.insert(keys.begin(), keys.end());
  return Status::Ok();
}

Status TransactionManager::CheckVersions(Transaction& txn, db::Transaction& tx) {
  for (const auto& [name, read] : txn.reads_) {
    const auto     head    = versions_->Current(tx, read.key);
    const uint64_t current = head ? head->version : 0;
    if (current == read.version) continue;

    if (txn.mode_ == Mode::kPessimistic) {
      return {StatusCode::kLockExpired, name + " changed while locked: read version " + std::to_string(read.version) + ", current " +
                                            std::to_string(current)};
    }
    return {StatusCode::kOptimisticConflict,
            name + " read at version " + std::to_string(read.version) + " but current is " + std::to_string(current)};
  }
  return Status::Ok();
}

Status TransactionManager::WriteAll(Transaction& txn, db::Transaction& tx, std::vector<CommittedMutation>& mutations) {
  const uint64_t now_ms = util::ToUnixMillis(util::Now());

  for (const auto& [name, write] : txn.writes_) {
    const auto& read = txn.reads_.at(name);

    const auto     head    = versions_->Current(tx, write.key);
    const uint64_t version = (head ? head->version : 0) + 1;
    // Non-decreasing per entity even if the wall clock stepped back.
    const uint64_t committed_at_ms = std::max(now_ms, head ? head->committed_at_ms : 0);

    std::optional<google::protobuf::Struct> previous;
    if (read.snapshot) previous = read.snapshot->payload();

    v1::StateChangeEvent event;
    *event.mutable_key() = write.key;
    event.set_version(version);
    event.set_event_type(write.event_type);
    event.set_actor(txn.actor_);
    *event.mutable_committed_at() = util::MillisToProto(committed_at_ms);
    for (const auto& [k, v] : write.metadata) {
      (*event.mutable_metadata())[k] = v;
    }
    if (!previous || write.replace || write.event_type == model::kEventCreated) {
      *event.mutable_delta() = store::ReplaceDelta(write.payload);
    } else {
      *event.mutable_delta() = store::ComputeDelta(*previous, write.payload);
    }

    if (auto status = FromDbResult(events_->Append(tx, event), "append event for " + name); !status.ok()) return status;

    v1::EntitySnapshot snapshot;
    *snapshot.mutable_key()          = write.key;
    snapshot.set_version(version);
    *snapshot.mutable_payload()      = write.payload;
    *snapshot.mutable_committed_at() = event.committed_at();
    snapshot.set_actor(txn.actor_);
    snapshot.set_event_type(write.event_type);

    if (auto status = FromDbResult(versions_->Put(tx, snapshot), "put snapshot for " + name); !status.ok()) return status;

    mutations.push_back({std::move(event), std::move(previous), write.payload});
  }
  return Status::Ok();
}

CommitResult TransactionManager::Commit(Transaction& txn) {
  txn.EnsureActive("commit");

  CommitResult result;
  auto         fail = [&](Status status) {
    STATECORE_LOG_INFO("transaction commit failed", {StringField("txn", txn.id_), StringField("mode", ToString(txn.mode_)),
                                                      StringField("status", txn::ToString(status.code())),
                                                      StringField("detail", status.message())});
    Abort(txn);
    result.status = std::move(status);
    return result;
  };

  if (auto status = Validate(txn); !status.ok()) return fail(std::move(status));

  std::vector<CommittedMutation> mutations;
  try {
    auto tx = txn.writes_.empty() ? repository_->BeginReadOnly() : repository_->Begin();

    if (auto status = CheckVersions(txn, *tx); !status.ok()) return fail(std::move(status));
    if (auto status = WriteAll(txn, *tx, mutations); !status.ok()) return fail(std::move(status));

    tx->Commit();
  } catch (const db::CommitFailed& e) {
    if (e.IsConflict()) return fail({StatusCode::kOptimisticConflict, e.what()});
    // Outcome unknown: the caller must re-read before retrying.
    STATECORE_LOG_ERROR("backing store commit failed", {StringField("txn", txn.id_), StringField("error", e.what())});
    return fail({StatusCode::kStorageError, e.what()});
  } catch (const util::ConflictError& e) {
    STATECORE_LOG_ERROR("commit invariant violated", {StringField("txn", txn.id_), StringField("error", e.what())});
    return fail({StatusCode::kConflictError, e.what()});
  } catch (const std::exception& e) {
    return fail({StatusCode::kStorageError, e.what()});
  }

  for (const auto& m : mutations) {
    result.committed.emplace_back(m.event.key(), m.event.version());
  }

  if (!mutations.empty()) {
    STATECORE_LOG_DEBUG("transaction committed", {StringField("txn", txn.id_), StringField("mode", ToString(txn.mode_)),
                                                  IntField("entities", static_cast<int64_t>(mutations.size()))});
    Notify(mutations);
  }

  Finish(txn);
  return result;
}

void TransactionManager::Notify(const std::vector<CommittedMutation>& mutations) {
  for (const auto& listener : listeners_) {
    try {
      listener->OnCommitted(mutations);
    } catch (const std::exception& e) {
      STATECORE_LOG_ERROR("commit listener failed", {StringField("error", e.what())});
    }
  }
}

CommitResult TransactionManager::RunWithRetry(Mode mode, const std::function<Status(Transaction&)>& body, const RetryPolicy& policy,
                                              std::string actor) {
  CommitResult result;
  const int    attempts = std::max(policy.max_attempts, 1);

  for (int attempt = 1; attempt <= attempts; ++attempt) {
    auto txn = Begin(mode, actor);

    auto status = body(*txn);
    if (status.ok()) {
      result = Commit(*txn);
    } else {
      Abort(*txn);
      result = CommitResult{std::move(status), {}};
    }

    if (result.status.ok() || !result.status.IsRetryable() || attempt == attempts) return result;

    const auto delay = Backoff(policy, attempt);
    STATECORE_LOG_DEBUG("retrying transaction", {IntField("attempt", attempt), StringField("status", txn::ToString(result.status.code())),
                                                 IntField("backoff_ms", delay.count())});
    std::this_thread::sleep_for(delay);
  }
  return result;
}

} // namespace statecore::txn
