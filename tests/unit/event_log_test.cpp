#include "internal/store/event_log.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/version_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono_literals;
using namespace statecore;

const auto kT1 = model::MakeKey(v1::ENTITY_TYPE_TASK, "T1");

v1::StateChangeEvent MakeEvent(uint64_t version, const std::string& type, const std::string& status, uint64_t at_ms) {
  v1::StateChangeEvent event;
  *event.mutable_key() = kT1;
  event.set_version(version);
  event.set_event_type(type);
  event.set_actor("writer");
  *event.mutable_committed_at() = util::MillisToProto(at_ms);
  google::protobuf::Struct payload;
  (*payload.mutable_fields())["status"].set_string_value(status);
  *event.mutable_delta() = store::ReplaceDelta(payload);
  if (type != "entity_created") event.mutable_delta()->set_replace(false);
  return event;
}

v1::EntitySnapshot SnapshotOf(const v1::StateChangeEvent& event, const google::protobuf::Struct& payload) {
  v1::EntitySnapshot snapshot;
  *snapshot.mutable_key() = event.key();
  snapshot.set_version(event.version());
  *snapshot.mutable_payload()      = payload;
  *snapshot.mutable_committed_at() = event.committed_at();
  snapshot.set_actor(event.actor());
  snapshot.set_event_type(event.event_type());
  return snapshot;
}

// Writes events 1..n at 1000, 2000, ... ms with status s1, s2, ...
void Seed(db::Repository& repo, store::EventLog& log, store::VersionStore& versions, int n) {
  google::protobuf::Struct payload;
  for (int i = 1; i <= n; ++i) {
    auto tx    = repo.Begin();
    auto event = MakeEvent(i, i == 1 ? "entity_created" : "entity_updated", "s" + std::to_string(i), 1000 * i);
    assert(log.Append(*tx, event));
    payload = store::ApplyEvent(payload, event);
    assert(versions.Put(*tx, SnapshotOf(event, payload)));
    tx->Commit();
  }
}

std::string Status(const google::protobuf::Struct& payload) {
  return payload.fields().at("status").string_value();
}

void TestRangesAndTimeQueries() {
  auto repo     = std::make_shared<db::memory::MemoryRepository>();
  auto log      = store::EventLog(repo);
  auto versions = store::VersionStore(repo);
  Seed(*repo, log, versions, 4);

  assert(log.List(kT1).size() == 4);
  assert(log.List(kT1, 2).size() == 2);

  auto range = log.ListRange(kT1, 2, 3);
  assert(range.size() == 2);
  assert(range.front().version() == 2);
  assert(range.back().version() == 3);
  assert(log.ListRange(kT1, 3, std::nullopt).size() == 2);

  auto by_time = log.ListByTime(kT1, 1500, 3000);
  assert(by_time.size() == 2);
  assert(by_time.front().version() == 2);
  assert(log.ListByTime(kT1, 0, std::nullopt).size() == 4);
}

void TestReconstructMatchesVersionStore() {
  auto repo     = std::make_shared<db::memory::MemoryRepository>();
  auto log      = store::EventLog(repo);
  auto versions = store::VersionStore(repo);
  Seed(*repo, log, versions, 5);

  for (uint64_t v = 1; v <= 5; ++v) {
    auto state = log.Reconstruct(kT1, v);
    assert(state.has_value());
    assert(state->version == v);
    assert(store::PayloadEquals(state->payload, versions.Get(kT1, v)->payload()));
  }

  auto at = log.ReconstructAtTime(kT1, 3500);
  assert(at->version == 3);
  assert(at->committed_at_ms == 3000);
  assert(Status(at->payload) == "s3");
  assert(versions.GetAtTime(kT1, 3500)->version() == 3);

  assert(!log.ReconstructAtTime(kT1, 999).has_value());
  assert(!log.Reconstruct(model::MakeKey(v1::ENTITY_TYPE_AGENT, "T1")).has_value());
}

void TestDuplicateVersionIsRejected() {
  auto repo     = std::make_shared<db::memory::MemoryRepository>();
  auto log      = store::EventLog(repo);
  auto versions = store::VersionStore(repo);
  Seed(*repo, log, versions, 2);

  auto tx        = repo->Begin();
  auto duplicate = MakeEvent(2, "entity_updated", "again", 5000);
  assert(!log.Append(*tx, duplicate));
  assert(!versions.Put(*tx, SnapshotOf(duplicate, {})));
  tx->Rollback();

  auto gap     = repo->Begin();
  bool threw   = false;
  auto skipped = MakeEvent(4, "entity_updated", "skip", 5000);
  try {
    (void)versions.Put(*gap, SnapshotOf(skipped, {}));
  } catch (const util::ConflictError&) {
    threw = true;
  }
  assert(threw && "a version gap is an invariant violation");

  auto history = versions.History(kT1);
  assert(history.size() == 2);
  assert(history[1].actor() == "writer");
  assert(history[1].size_bytes() > 0);
}

} // namespace

int main() {
  TestRangesAndTimeQueries();
  TestReconstructMatchesVersionStore();
  TestDuplicateVersionIsRejected();

  std::cout << "statecore_unit_event_log: pass\n";
  return 0;
}
