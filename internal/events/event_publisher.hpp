#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

#include "internal/txn/commit_listener.hpp"
#include "statecore/v1/event.pb.h"

namespace statecore::events {

using Subscriber = std::function<void(const v1::CommittedEvent&)>;

/*
  EventPublisher

  Outbound stream of committed mutations. OnCommitted only enqueues; one
  dispatch thread delivers to subscribers in commit order. The queue is
  bounded: when full, the oldest event is dropped. Subscribers are
  optional and a throwing subscriber never affects the others.
*/
class EventPublisher : public txn::CommitListener {
 public:
  explicit EventPublisher(std::size_t capacity = 10000);
  ~EventPublisher() override;

  void Start();
  // Delivers what is already queued, then joins the dispatch thread.
  void Stop();

  uint64_t Subscribe(Subscriber subscriber);
  void     Unsubscribe(uint64_t id);

  void Publish(v1::CommittedEvent event);

  void OnCommitted(const std::vector<txn::CommittedMutation>& mutations) override;

  // Blocks until every queued event has been delivered.
  void Flush();

  uint64_t Dropped();

 private:
  void Loop();
  void Deliver(const v1::CommittedEvent& event);

  std::size_t capacity_;

  std::mutex                     mutex_;
  std::condition_variable        ready_;
  std::condition_variable        idle_;
  std::deque<v1::CommittedEvent> queue_;
  bool                           running_    = false;
  bool                           delivering_ = false;
  uint64_t                       dropped_    = 0;
  std::thread                    thread_;

  std::mutex                     subscribers_mutex_;
  std::map<uint64_t, Subscriber> subscribers_;
  uint64_t                       next_id_ = 1;
};

} // namespace statecore::events
