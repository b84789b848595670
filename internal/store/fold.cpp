#include "fold.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <algorithm>
#include <string>

#include "internal/model/lifecycle.hpp"

namespace statecore::store {

using google::protobuf::util::MessageDifferencer;

Payload ApplyDelta(const Payload& payload, const v1::EntityDelta& delta) {
  if (delta.replace()) return delta.set();

  Payload out = payload;
  auto*   fields = out.mutable_fields();
  for (const auto& [name, value] : delta.set().fields()) {
    (*fields)[name] = value;
  }
  for (const auto& name : delta.removed()) {
    fields->erase(name);
  }
  return out;
}

Payload ApplyEvent(const Payload& payload, const v1::StateChangeEvent& event) {
  if (event.event_type() == model::kEventCreated) {
    return ApplyDelta(Payload{}, event.delta());
  }
  return ApplyDelta(payload, event.delta());
}

Payload Fold(const std::vector<v1::StateChangeEvent>& events) {
  Payload state;
  for (const auto& event : events) {
    state = ApplyEvent(state, event);
  }
  return state;
}

v1::EntityDelta ComputeDelta(const Payload& before, const Payload& after) {
  v1::EntityDelta delta;
  auto*           set = delta.mutable_set()->mutable_fields();

  for (const auto& [name, value] : after.fields()) {
    auto it = before.fields().find(name);
    if (it == before.fields().end() || !MessageDifferencer::Equals(it->second, value)) {
      (*set)[name] = value;
    }
  }

  std::vector<std::string> removed;
  for (const auto& [name, value] : before.fields()) {
    if (after.fields().find(name) == after.fields().end()) removed.push_back(name);
  }
  // map iteration order is unspecified; keep deltas deterministic
  std::sort(removed.begin(), removed.end());
  for (auto& name : removed) {
    delta.add_removed(std::move(name));
  }
  return delta;
}

v1::EntityDelta ReplaceDelta(const Payload& after) {
  v1::EntityDelta delta;
  *delta.mutable_set() = after;
  delta.set_replace(true);
  return delta;
}

bool PayloadEquals(const Payload& a, const Payload& b) {
  return MessageDifferencer::Equals(a, b);
}

} // namespace statecore::store
