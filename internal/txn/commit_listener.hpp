#pragma once

#include <optional>
#include <vector>

#include "google/protobuf/struct.pb.h"
#include "statecore/v1/event.pb.h"

namespace statecore::txn {

// One entity mutation of a committed transaction.
struct CommittedMutation {
  v1::StateChangeEvent                    event;
  std::optional<google::protobuf::Struct> previous_payload;
  google::protobuf::Struct                payload;
};

/*
  Notified after the backing-store commit succeeded, in registration order.
  The commit is already durable; a listener failure is logged, never
  reported as a commit failure.
*/
class CommitListener {
 public:
  virtual ~CommitListener() = default;

  virtual void OnCommitted(const std::vector<CommittedMutation>& mutations) = 0;
};

} // namespace statecore::txn
