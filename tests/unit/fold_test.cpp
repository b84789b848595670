#include "internal/store/fold.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using statecore::store::ApplyDelta;
using statecore::store::ApplyEvent;
using statecore::store::ComputeDelta;
using statecore::store::Fold;
using statecore::store::Payload;
using statecore::store::PayloadEquals;
using statecore::store::ReplaceDelta;
using statecore::v1::StateChangeEvent;

Payload MakePayload(std::initializer_list<std::pair<std::string, std::string>> fields) {
  Payload payload;
  for (const auto& [k, v] : fields) {
    (*payload.mutable_fields())[k].set_string_value(v);
  }
  return payload;
}

StateChangeEvent MakeEvent(uint64_t version, const std::string& type, const statecore::v1::EntityDelta& delta) {
  StateChangeEvent event;
  event.set_version(version);
  event.set_event_type(type);
  *event.mutable_delta() = delta;
  return event;
}

void TestMergeDeltaOverwritesAndRemoves() {
  const auto before = MakePayload({{"status", "pending"}, {"owner", "a"}, {"note", "x"}});

  statecore::v1::EntityDelta delta;
  (*delta.mutable_set()->mutable_fields())["status"].set_string_value("running");
  delta.add_removed("note");

  const auto after = ApplyDelta(before, delta);
  assert(PayloadEquals(after, MakePayload({{"status", "running"}, {"owner", "a"}})));
}

void TestReplaceDeltaDiscardsOldFields() {
  const auto before = MakePayload({{"status", "cancelled"}, {"reason", "timeout"}});
  const auto target = MakePayload({{"status", "pending"}});

  assert(PayloadEquals(ApplyDelta(before, ReplaceDelta(target)), target));
}

void TestComputeDeltaRoundTrips() {
  const auto before = MakePayload({{"status", "pending"}, {"owner", "a"}, {"b", "1"}, {"a", "2"}});
  const auto after  = MakePayload({{"status", "running"}, {"owner", "a"}, {"new", "y"}});

  const auto delta = ComputeDelta(before, after);
  assert(!delta.replace());
  assert(delta.set().fields().size() == 2);
  assert(delta.removed_size() == 2);
  assert(delta.removed(0) == "a");
  assert(delta.removed(1) == "b");
  assert(PayloadEquals(ApplyDelta(before, delta), after));
}

void TestCreatedEventStartsFromEmpty() {
  const auto stale = MakePayload({{"leftover", "1"}});

  statecore::v1::EntityDelta delta;
  (*delta.mutable_set()->mutable_fields())["status"].set_string_value("pending");

  const auto result = ApplyEvent(stale, MakeEvent(1, "entity_created", delta));
  assert(PayloadEquals(result, MakePayload({{"status", "pending"}})));
}

void TestFoldReproducesEveryVersion() {
  const auto v1 = MakePayload({{"status", "pending"}});
  const auto v2 = MakePayload({{"status", "running"}, {"agent", "A1"}});
  const auto v3 = MakePayload({{"status", "cancelled"}});
  const auto v4 = v1;

  std::vector<StateChangeEvent> events;
  events.push_back(MakeEvent(1, "entity_created", ReplaceDelta(v1)));
  events.push_back(MakeEvent(2, "entity_updated", ComputeDelta(v1, v2)));
  events.push_back(MakeEvent(3, "entity_updated", ComputeDelta(v2, v3)));
  events.push_back(MakeEvent(4, "rollback", ReplaceDelta(v4)));

  const Payload expected[] = {v1, v2, v3, v4};
  for (std::size_t n = 1; n <= events.size(); ++n) {
    std::vector<StateChangeEvent> prefix(events.begin(), events.begin() + static_cast<std::ptrdiff_t>(n));
    assert(PayloadEquals(Fold(prefix), expected[n - 1]));
  }
}

void TestNestedValuesAreReplacedWhole() {
  Payload before;
  auto*   tags = (*before.mutable_fields())["tags"].mutable_list_value();
  tags->add_values()->set_string_value("a");

  Payload after = before;
  (*after.mutable_fields())["tags"].mutable_list_value()->add_values()->set_string_value("b");

  const auto delta = ComputeDelta(before, after);
  assert(delta.set().fields().count("tags") == 1);
  assert(PayloadEquals(ApplyDelta(before, delta), after));
}

} // namespace

int main() {
  TestMergeDeltaOverwritesAndRemoves();
  TestReplaceDeltaDiscardsOldFields();
  TestComputeDeltaRoundTrips();
  TestCreatedEventStartsFromEmpty();
  TestFoldReproducesEveryVersion();
  TestNestedValuesAreReplacedWhole();

  std::cout << "statecore_unit_fold: pass\n";
  return 0;
}
