#include "internal/txn/transaction_manager.hpp"

#include <atomic>
#include <functional>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/fold.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using namespace statecore;
using txn::Mode;
using txn::StatusCode;

struct Harness {
  explicit Harness(std::shared_ptr<db::Repository> repo = std::make_shared<db::memory::MemoryRepository>()) : repository(std::move(repo)) {
  }

  std::shared_ptr<db::Repository>          repository;
  std::shared_ptr<store::VersionStore>     versions   = std::make_shared<store::VersionStore>(repository);
  std::shared_ptr<store::EventLog>         events     = std::make_shared<store::EventLog>(repository);
  std::shared_ptr<lock::LockManager>       locks      = std::make_shared<lock::LockManager>();
  std::shared_ptr<txn::TransactionManager> txns       = std::make_shared<txn::TransactionManager>(repository, versions, events, locks);
};

txn::Mutator SetField(const std::string& field, const std::string& value) {
  return [field, value](google::protobuf::Struct& payload) { (*payload.mutable_fields())[field].set_string_value(value); };
}

std::string StatusOf(const v1::EntitySnapshot& snapshot) {
  return snapshot.payload().fields().at("status").string_value();
}

const auto kT1 = model::MakeKey(v1::ENTITY_TYPE_TASK, "T1");
const auto kT2 = model::MakeKey(v1::ENTITY_TYPE_TASK, "T2");

void Create(Harness& h, const model::EntityKey& key, const std::string& status) {
  auto txn = h.txns->Begin(Mode::kOptimistic, "creator");
  assert(txn->StageWrite(key, SetField("status", status)).ok());
  assert(h.txns->Commit(*txn).status.ok());
}

class RecordingListener final : public txn::CommitListener {
 public:
  void OnCommitted(const std::vector<txn::CommittedMutation>& mutations) override {
    for (const auto& m : mutations) {
      seen.push_back(m.event.version());
    }
  }
  std::vector<uint64_t> seen;
};

class ThrowingListener final : public txn::CommitListener {
 public:
  void OnCommitted(const std::vector<txn::CommittedMutation>&) override {
    throw std::runtime_error("listener down");
  }
};

// Memory repository with scripted faults around the write transaction.
class ScriptedRepository final : public db::Repository {
 public:
  // One-shot; runs inside Begin() of the next write transaction.
  std::function<void()> on_begin;
  // Write commits throw CommitFailed{conflict=false} without applying anything.
  bool fail_commit = false;
  // Once a write transaction appended an event, it no longer sees the entity's head.
  bool lose_head_after_append = false;

  class Tx final : public db::Transaction {
   public:
    Tx(ScriptedRepository& repo, std::unique_ptr<db::Transaction> inner, bool read_only)
        : repo_(repo), inner_(std::move(inner)), read_only_(read_only) {
    }

    void Commit() override {
      if (!read_only_ && repo_.fail_commit) {
        inner_->Rollback();
        throw db::CommitFailed("connection reset during commit", false);
      }
      inner_->Commit();
    }
    void Rollback() override {
      inner_->Rollback();
    }
    bool IsCommitted() const override {
      return inner_->IsCommitted();
    }

    db::Transaction& Inner() {
      return *inner_;
    }

    bool appended = false;

   private:
    ScriptedRepository&              repo_;
    std::unique_ptr<db::Transaction> inner_;
    bool                             read_only_;
  };

  std::unique_ptr<db::Transaction> Begin() override {
    if (on_begin) {
      auto hook = std::move(on_begin);
      on_begin  = nullptr;
      hook();
    }
    return std::make_unique<Tx>(*this, inner_.Begin(), false);
  }
  std::unique_ptr<db::Transaction> BeginReadOnly() override {
    return std::make_unique<Tx>(*this, inner_.BeginReadOnly(), true);
  }

  db::Result InsertSnapshot(db::Transaction& t, const db::model::SnapshotRecord& r) override {
    return inner_.InsertSnapshot(Unwrap(t), r);
  }
  std::optional<db::model::SnapshotRecord> GetSnapshot(db::Transaction& t, const std::string& type, const std::string& id,
                                                       uint64_t version) override {
    return inner_.GetSnapshot(Unwrap(t), type, id, version);
  }
  std::optional<db::model::SnapshotRecord> GetLatestSnapshot(db::Transaction& t, const std::string& type, const std::string& id) override {
    return inner_.GetLatestSnapshot(Unwrap(t), type, id);
  }
  std::optional<db::model::SnapshotRecord> GetSnapshotAtTime(db::Transaction& t, const std::string& type, const std::string& id,
                                                             uint64_t at_ms) override {
    return inner_.GetSnapshotAtTime(Unwrap(t), type, id, at_ms);
  }
  std::optional<db::model::EntityHeadRecord> GetCurrent(db::Transaction& t, const std::string& type, const std::string& id) override {
    if (lose_head_after_append && static_cast<Tx&>(t).appended) return std::nullopt;
    return inner_.GetCurrent(Unwrap(t), type, id);
  }
  std::vector<db::model::SnapshotRecord> ListVersions(db::Transaction& t, const std::string& type, const std::string& id) override {
    return inner_.ListVersions(Unwrap(t), type, id);
  }
  std::vector<db::model::SnapshotRecord> ListCurrent(db::Transaction& t, const std::string& type, const db::Pagination& pagination,
                                                     bool include_deleted) override {
    return inner_.ListCurrent(Unwrap(t), type, pagination, include_deleted);
  }
  db::Result AppendEvent(db::Transaction& t, const db::model::EventRecord& r) override {
    static_cast<Tx&>(t).appended = true;
    return inner_.AppendEvent(Unwrap(t), r);
  }
  std::vector<db::model::EventRecord> ListEvents(db::Transaction& t, const std::string& type, const std::string& id, uint64_t from_version,
                                                 std::optional<uint64_t> to_version) override {
    return inner_.ListEvents(Unwrap(t), type, id, from_version, to_version);
  }
  std::vector<db::model::EventRecord> ListEventsByTime(db::Transaction& t, const std::string& type, const std::string& id, uint64_t from_ms,
                                                       std::optional<uint64_t> to_ms) override {
    return inner_.ListEventsByTime(Unwrap(t), type, id, from_ms, to_ms);
  }

 private:
  static db::Transaction& Unwrap(db::Transaction& t) {
    return static_cast<Tx&>(t).Inner();
  }

  db::memory::MemoryRepository inner_;
};

void TestCommitAppendsEventAndSnapshot() {
  Harness h;
  auto    recorder = std::make_shared<RecordingListener>();
  h.txns->AddListener(std::make_shared<ThrowingListener>());
  h.txns->AddListener(recorder);

  Create(h, kT1, "pending");

  auto txn = h.txns->Begin(Mode::kOptimistic, "agent-a");
  assert(txn->ReadEntity(kT1).snapshot->version() == 1);
  assert(txn->StageWrite(kT1, SetField("status", "running")).ok());
  assert(txn->StageWrite(kT1, SetField("agent", "A1")).ok());

  // Staged writes are visible only to their own handle.
  assert(StatusOf(*txn->ReadEntity(kT1).snapshot) == "running");
  assert(StatusOf(*h.versions->Get(kT1)) == "pending");

  auto result = h.txns->Commit(*txn);
  assert(result.status.ok());
  assert(result.committed.size() == 1);
  assert(result.committed[0].second == 2);
  assert(!txn->IsActive());

  auto v2 = h.versions->Get(kT1);
  assert(v2->version() == 2);
  assert(v2->actor() == "agent-a");
  assert(v2->event_type() == "entity_updated");
  assert(v2->payload().fields().at("agent").string_value() == "A1");

  auto events = h.events->List(kT1);
  assert(events.size() == 2);
  assert(events[0].event_type() == "entity_created");
  assert(events[1].delta().set().fields().size() == 2);
  assert(store::PayloadEquals(store::Fold(events), v2->payload()));
  assert(!events[0].event_id().empty());
  assert(events[0].event_id() != events[1].event_id());

  assert((recorder->seen == std::vector<uint64_t>{1, 2}));
}

void TestConcurrentOptimisticReadersOneWins() {
  Harness h;
  Create(h, kT1, "pending");

  auto a = h.txns->Begin(Mode::kOptimistic, "a");
  auto b = h.txns->Begin(Mode::kOptimistic, "b");
  assert(a->ReadEntity(kT1).status.ok());
  assert(b->ReadEntity(kT1).status.ok());
  assert(a->StageWrite(kT1, SetField("status", "running")).ok());
  assert(b->StageWrite(kT1, SetField("status", "running")).ok());

  assert(h.txns->Commit(*a).status.ok());
  auto lost = h.txns->Commit(*b);
  assert(lost.status.code() == StatusCode::kOptimisticConflict);
  assert(lost.status.IsRetryable());
  assert(lost.committed.empty());
  assert(h.versions->CurrentVersion(kT1) == 2u);
}

void TestConcurrentWritersLeaveNoGaps() {
  Harness h;
  Create(h, kT1, "pending");

  constexpr int          kThreads = 8;
  constexpr int          kWrites  = 10;
  std::atomic<int>       successes{0};
  std::vector<std::thread> threads;

  txn::RetryPolicy policy;
  policy.max_attempts = 100;
  policy.base_backoff = 1ms;
  policy.max_backoff  = 20ms;

  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kWrites; ++i) {
        auto result = h.txns->RunWithRetry(
            Mode::kOptimistic,
            [&](txn::Transaction& txn) {
              auto read = txn.ReadEntity(kT1);
              if (!read.status.ok()) return read.status;
              const auto count = read.snapshot->payload().fields().count("count") ? read.snapshot->payload().fields().at("count").number_value() : 0.0;
              return txn.StageWrite(kT1, [count](google::protobuf::Struct& payload) { (*payload.mutable_fields())["count"].set_number_value(count + 1); });
            },
            policy);
        if (result.status.ok()) ++successes;
      }
    });
  }
  for (auto& thread : threads) thread.join();

  const auto history = h.versions->History(kT1);
  assert(history.size() == static_cast<std::size_t>(successes.load()) + 1);
  for (std::size_t i = 0; i < history.size(); ++i) {
    assert(history[i].version() == i + 1);
  }
  assert(h.versions->Get(kT1)->payload().fields().at("count").number_value() == successes.load());
}

void TestPessimisticLockBlocksSecondWriter() {
  Harness h;
  Create(h, kT1, "pending");

  auto first = h.txns->Begin(Mode::kPessimistic, "first");
  assert(first->StageWrite(kT1, SetField("status", "running")).ok());

  std::atomic<bool>     second_done{false};
  std::atomic<uint64_t> second_read{0};
  std::thread           second([&] {
    auto txn  = h.txns->Begin(Mode::kPessimistic, "second");
    auto read = txn->ReadEntity(kT1);  // blocks on the lock
    second_read = read.snapshot->version();
    assert(txn->StageWrite(kT1, SetField("status", "done")).ok());
    assert(h.txns->Commit(*txn).status.ok());
    second_done = true;
  });

  std::this_thread::sleep_for(50ms);
  assert(!second_done.load());

  assert(h.txns->Commit(*first).status.ok());
  second.join();

  assert(second_read.load() == 2);
  assert(StatusOf(*h.versions->Get(kT1)) == "done");
  assert(h.versions->CurrentVersion(kT1) == 3u);
}

void TestOptimisticWriterExcludedByLock() {
  Harness h;
  Create(h, kT1, "pending");

  auto holder = h.txns->Begin(Mode::kPessimistic, "holder");
  assert(holder->Lock({model::KeyString(kT1)}).ok());

  auto writer = h.txns->Begin(Mode::kOptimistic, "writer");
  assert(writer->StageWrite(kT1, SetField("status", "running")).ok());
  assert(h.txns->Commit(*writer).status.code() == StatusCode::kOptimisticConflict);

  h.txns->Abort(*holder);
  assert(!h.locks->Inspect(model::KeyString(kT1)).has_value());
}

void TestMultiEntityCommitIsAllOrNothing() {
  Harness h;
  Create(h, kT1, "pending");
  Create(h, kT2, "pending");

  auto txn = h.txns->Begin(Mode::kOptimistic, "batch");
  assert(txn->StageWrite(kT1, SetField("status", "running")).ok());
  assert(txn->StageWrite(kT2, SetField("status", "running")).ok());

  // T2 moves on underneath the batch.
  auto other = h.txns->Begin(Mode::kOptimistic, "other");
  assert(other->StageWrite(kT2, SetField("status", "cancelled")).ok());
  assert(h.txns->Commit(*other).status.ok());

  assert(h.txns->Commit(*txn).status.code() == StatusCode::kOptimisticConflict);
  assert(h.versions->CurrentVersion(kT1) == 1u);
  assert(h.events->List(kT1).size() == 1);
  assert(StatusOf(*h.versions->Get(kT2)) == "cancelled");
}

void TestExpiredLeaseFailsCommit() {
  Harness h;
  Create(h, kT1, "pending");

  lock::AcquireOptions short_lease;
  short_lease.lease = 20ms;

  auto txn = h.txns->Begin(Mode::kPessimistic, "slow");
  assert(txn->Lock({model::KeyString(kT1)}, short_lease).ok());
  assert(txn->StageWrite(kT1, SetField("status", "running")).ok());
  std::this_thread::sleep_for(50ms);

  auto result = h.txns->Commit(*txn);
  assert(result.status.code() == StatusCode::kLockExpired);
  assert(!result.status.IsRetryable());
  assert(h.versions->CurrentVersion(kT1) == 1u);
}

void TestLockTimeoutIsRetryable() {
  Harness h;
  Create(h, kT1, "pending");

  auto holder = h.txns->Begin(Mode::kPessimistic, "holder");
  assert(holder->Lock({model::KeyString(kT1)}).ok());

  lock::AcquireOptions quick;
  quick.timeout = 20ms;
  auto waiter   = h.txns->Begin(Mode::kPessimistic, "waiter");
  auto status   = waiter->Lock({model::KeyString(kT1)}, quick);
  assert(status.code() == StatusCode::kLockTimeout);
  assert(status.IsRetryable());

  auto optimistic = h.txns->Begin(Mode::kOptimistic, "o");
  assert(optimistic->Lock({"x"}).code() == StatusCode::kInvalidState);
}

void TestDeletedEntityRejectsWrites() {
  Harness h;
  Create(h, kT1, "pending");

  auto del = h.txns->Begin(Mode::kOptimistic, "ops");
  assert(del->StageDelete(kT1, "obsolete").ok());
  assert(h.txns->Commit(*del).status.ok());

  auto deleted = h.versions->Get(kT1);
  assert(StatusOf(*deleted) == "deleted");
  assert(deleted->event_type() == "entity_deleted");
  assert(h.events->List(kT1).back().metadata().at("reason") == "obsolete");

  auto write = h.txns->Begin(Mode::kOptimistic, "late");
  assert(write->StageWrite(kT1, SetField("status", "running")).code() == StatusCode::kInvalidState);

  txn::WriteOptions restore;
  restore.event_type = "rollback";
  restore.replace    = true;
  assert(write->StageWrite(kT1, SetField("status", "pending"), restore).ok());
  assert(h.txns->Commit(*write).status.ok());
  assert(StatusOf(*h.versions->Get(kT1)) == "pending");

  auto missing = h.txns->Begin(Mode::kOptimistic, "ops");
  assert(missing->StageDelete(model::MakeKey(v1::ENTITY_TYPE_TASK, "nope"), "x").code() == StatusCode::kNotFound);
}

void TestFinishedHandleThrows() {
  Harness h;
  auto    txn = h.txns->Begin(Mode::kOptimistic);
  h.txns->Abort(*txn);
  h.txns->Abort(*txn);

  bool threw = false;
  try {
    (void)h.txns->Commit(*txn);
  } catch (const util::InvalidState&) {
    threw = true;
  }
  assert(threw && "commit on a finished handle must throw");
}

void TestDestroyedHandleReleasesLocks() {
  Harness h;
  Create(h, kT1, "pending");
  {
    auto txn = h.txns->Begin(Mode::kPessimistic, "dropped");
    assert(txn->StageWrite(kT1, SetField("status", "running")).ok());
    assert(h.locks->Inspect(model::KeyString(kT1)).has_value());
  }
  assert(!h.locks->Inspect(model::KeyString(kT1)).has_value());
  assert(h.versions->CurrentVersion(kT1) == 1u);
}

void TestReadOnlyCommitAndNonRetryableBody() {
  Harness h;
  Create(h, kT1, "pending");

  auto reader = h.txns->Begin(Mode::kOptimistic);
  assert(reader->ReadEntity(kT1).status.ok());
  auto result = h.txns->Commit(*reader);
  assert(result.status.ok());
  assert(result.committed.empty());

  int  attempts = 0;
  auto outcome  = h.txns->RunWithRetry(Mode::kOptimistic, [&](txn::Transaction&) {
    ++attempts;
    return txn::Status{StatusCode::kInvalidState, "refused"};
  });
  assert(outcome.status.code() == StatusCode::kInvalidState);
  assert(attempts == 1);
}

void TestLockHolderCannotReadInsideOptimisticCommit() {
  auto repo = std::make_shared<ScriptedRepository>();
  Harness h(repo);
  Create(h, kT1, "pending");

  auto writer = h.txns->Begin(Mode::kOptimistic, "writer");
  assert(writer->StageWrite(kT1, SetField("status", "running")).ok());

  lock::AcquireOptions fail_fast;
  fail_fast.wait = lock::WaitPolicy::kFailFast;

  auto holder  = h.txns->Begin(Mode::kPessimistic, "holder");
  repo->on_begin = [&] {
    // The written key is held by the committing transaction.
    auto info = h.locks->Inspect(model::KeyString(kT1));
    assert(info && info->owner == writer->Id());
    assert(holder->Lock({model::KeyString(kT1)}, fail_fast).code() == StatusCode::kLockTimeout);
  };

  assert(h.txns->Commit(*writer).status.ok());
  assert(!h.locks->Inspect(model::KeyString(kT1)).has_value());

  // The holder now sees the committed version and its own commit succeeds.
  assert(holder->ReadEntity(kT1).snapshot->version() == 2);
  assert(holder->StageWrite(kT1, SetField("status", "done")).ok());
  auto result = h.txns->Commit(*holder);
  assert(result.status.ok());
  assert(h.versions->CurrentVersion(kT1) == 3u);
}

void TestUnknownCommitOutcomeIsStorageError() {
  auto repo = std::make_shared<ScriptedRepository>();
  Harness h(repo);
  auto    recorder = std::make_shared<RecordingListener>();
  h.txns->AddListener(recorder);
  Create(h, kT1, "pending");

  repo->fail_commit = true;
  int  attempts     = 0;
  auto result       = h.txns->RunWithRetry(Mode::kOptimistic, [&](txn::Transaction& txn) {
    ++attempts;
    return txn.StageWrite(kT1, SetField("status", "running"));
  });
  repo->fail_commit = false;

  assert(result.status.code() == StatusCode::kStorageError);
  assert(!result.status.IsRetryable());
  assert(attempts == 1);
  assert(result.committed.empty());

  assert(h.versions->CurrentVersion(kT1) == 1u);
  assert(h.events->List(kT1).size() == 1);
  assert((recorder->seen == std::vector<uint64_t>{1}));
  assert(!h.locks->Inspect(model::KeyString(kT1)).has_value());
}

void TestNonSequentialPutIsConflictError() {
  auto repo = std::make_shared<ScriptedRepository>();
  Harness h(repo);
  auto    recorder = std::make_shared<RecordingListener>();
  h.txns->AddListener(recorder);
  Create(h, kT1, "pending");

  repo->lose_head_after_append = true;
  int  attempts                = 0;
  auto result                  = h.txns->RunWithRetry(Mode::kOptimistic, [&](txn::Transaction& txn) {
    ++attempts;
    return txn.StageWrite(kT1, SetField("status", "running"));
  });
  repo->lose_head_after_append = false;

  assert(result.status.code() == StatusCode::kConflictError);
  assert(!result.status.IsRetryable());
  assert(attempts == 1);

  assert(h.versions->CurrentVersion(kT1) == 1u);
  assert(h.events->List(kT1).size() == 1);
  assert((recorder->seen == std::vector<uint64_t>{1}));
}

} // namespace

int main() {
  TestCommitAppendsEventAndSnapshot();
  TestConcurrentOptimisticReadersOneWins();
  TestConcurrentWritersLeaveNoGaps();
  TestPessimisticLockBlocksSecondWriter();
  TestOptimisticWriterExcludedByLock();
  TestMultiEntityCommitIsAllOrNothing();
  TestExpiredLeaseFailsCommit();
  TestLockTimeoutIsRetryable();
  TestDeletedEntityRejectsWrites();
  TestFinishedHandleThrows();
  TestDestroyedHandleReleasesLocks();
  TestReadOnlyCommitAndNonRetryableBody();
  TestLockHolderCannotReadInsideOptimisticCommit();
  TestUnknownCommitOutcomeIsStorageError();
  TestNonSequentialPutIsConflictError();

  std::cout << "statecore_unit_transaction_manager: pass\n";
  return 0;
}
