#include "event_publisher.hpp"

#include <vector>

#include "internal/model/entity_key.hpp"
#include "internal/observability/logging.hpp"

namespace statecore::events {

namespace {

using observability::IntField;
using observability::StringField;

} // namespace

EventPublisher::EventPublisher(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

EventPublisher::~EventPublisher() {
  Stop();
}

void EventPublisher::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&EventPublisher::Loop, this);
}

void EventPublisher::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  ready_.notify_all();
  if (thread_.joinable()) thread_.join();
}

uint64_t EventPublisher::Subscribe(Subscriber subscriber) {
  std::lock_guard lock(subscribers_mutex_);
  const auto      id = next_id_++;
  subscribers_.emplace(id, std::move(subscriber));
  return id;
}

void EventPublisher::Unsubscribe(uint64_t id) {
  std::lock_guard lock(subscribers_mutex_);
  subscribers_.erase(id);
}

void EventPublisher::Publish(v1::CommittedEvent event) {
  bool dropped = false;
  {
    std::lock_guard lock(mutex_);
    if (queue_.size() >= capacity_) {
      queue_.pop_front();
      ++dropped_;
      dropped = true;
    }
    queue_.push_back(std::move(event));
  }
  ready_.notify_one();

  if (dropped) {
    STATECORE_LOG_WARN("event stream queue full, dropped oldest event", {IntField("capacity", static_cast<int64_t>(capacity_))});
  }
}

void EventPublisher::OnCommitted(const std::vector<txn::CommittedMutation>& mutations) {
  for (const auto& m : mutations) {
    v1::CommittedEvent event;
    *event.mutable_key() = m.event.key();
    event.set_version(m.event.version());
    event.set_event_type(m.event.event_type());
    event.set_actor(m.event.actor());
    *event.mutable_committed_at() = m.event.committed_at();
    Publish(std::move(event));
  }
}

void EventPublisher::Flush() {
  std::unique_lock lock(mutex_);
  idle_.wait(lock, [this] { return (queue_.empty() && !delivering_) || !running_; });
}

uint64_t EventPublisher::Dropped() {
  std::lock_guard lock(mutex_);
  return dropped_;
}

void EventPublisher::Loop() {
  std::unique_lock lock(mutex_);
  for (;;) {
    ready_.wait(lock, [this] { return !running_ || !queue_.empty(); });
    if (queue_.empty()) break;

    auto event = std::move(queue_.front());
    queue_.pop_front();
    delivering_ = true;

    lock.unlock();
    Deliver(event);
    lock.lock();

    delivering_ = false;
    if (queue_.empty()) idle_.notify_all();
  }
  idle_.notify_all();
}

void EventPublisher::Deliver(const v1::CommittedEvent& event) {
  std::vector<Subscriber> targets;
  {
    std::lock_guard lock(subscribers_mutex_);
    targets.reserve(subscribers_.size());
    for (const auto& [id, subscriber] : subscribers_) {
      targets.push_back(subscriber);
    }
  }

  for (const auto& subscriber : targets) {
    try {
      subscriber(event);
    } catch (const std::exception& e) {
      STATECORE_LOG_WARN("event subscriber failed", {StringField("key", model::KeyString(event.key())),
                                                     IntField("version", static_cast<int64_t>(event.version())),
                                                     StringField("error", e.what())});
    }
  }
}

} // namespace statecore::events
