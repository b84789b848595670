#include "internal/events/event_publisher.hpp"

#include <cassert>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace {

using namespace statecore;

v1::CommittedEvent MakeEvent(uint64_t version) {
  v1::CommittedEvent event;
  event.mutable_key()->set_type(v1::ENTITY_TYPE_TASK);
  event.mutable_key()->set_id("T1");
  event.set_version(version);
  event.set_event_type("entity_updated");
  return event;
}

void TestDeliversInOrderDespiteFailingSubscriber() {
  events::EventPublisher publisher(100);
  publisher.Start();

  std::mutex            mutex;
  std::vector<uint64_t> seen;
  publisher.Subscribe([](const v1::CommittedEvent&) { throw std::runtime_error("audit sink down"); });
  publisher.Subscribe([&](const v1::CommittedEvent& event) {
    std::lock_guard lock(mutex);
    seen.push_back(event.version());
  });

  for (uint64_t v = 1; v <= 5; ++v) {
    publisher.Publish(MakeEvent(v));
  }
  publisher.Flush();

  std::lock_guard lock(mutex);
  assert((seen == std::vector<uint64_t>{1, 2, 3, 4, 5}));
}

void TestFullQueueDropsOldest() {
  events::EventPublisher publisher(2);

  std::vector<uint64_t> seen;
  publisher.Subscribe([&](const v1::CommittedEvent& event) { seen.push_back(event.version()); });

  // Not started yet: everything queues.
  publisher.Publish(MakeEvent(1));
  publisher.Publish(MakeEvent(2));
  publisher.Publish(MakeEvent(3));
  assert(publisher.Dropped() == 1);

  publisher.Start();
  publisher.Stop();
  assert((seen == std::vector<uint64_t>{2, 3}));
}

void TestCommittedMutationsBecomeTuples() {
  events::EventPublisher publisher;
  publisher.Start();

  std::mutex                      mutex;
  std::vector<v1::CommittedEvent> seen;
  const auto                      id = publisher.Subscribe([&](const v1::CommittedEvent& event) {
    std::lock_guard lock(mutex);
    seen.push_back(event);
  });

  txn::CommittedMutation mutation;
  mutation.event.mutable_key()->set_type(v1::ENTITY_TYPE_WORKFLOW);
  mutation.event.mutable_key()->set_id("W1");
  mutation.event.set_version(7);
  mutation.event.set_event_type("rollback");
  mutation.event.set_actor("ops");
  mutation.event.mutable_committed_at()->set_seconds(42);

  publisher.OnCommitted({mutation});
  publisher.Flush();

  publisher.Unsubscribe(id);
  publisher.OnCommitted({mutation});
  publisher.Flush();

  std::lock_guard lock(mutex);
  assert(seen.size() == 1);
  assert(seen[0].key().id() == "W1");
  assert(seen[0].version() == 7);
  assert(seen[0].event_type() == "rollback");
  assert(seen[0].actor() == "ops");
  assert(seen[0].committed_at().seconds() == 42);
}

} // namespace

int main() {
  TestDeliversInOrderDespiteFailingSubscriber();
  TestFullQueueDropsOldest();
  TestCommittedMutationsBecomeTuples();

  std::cout << "statecore_unit_event_publisher: pass\n";
  return 0;
}
