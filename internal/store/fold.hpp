#pragma once

#include <vector>

#include "google/protobuf/struct.pb.h"
#include "statecore/v1/event.pb.h"

namespace statecore::store {

using Payload = google::protobuf::Struct;

/*
  Pure event-sourcing functions. No storage, no clock.

  Folding the events of versions 1..N in order yields exactly the payload
  stored for version N.
*/

// Applies a delta to a payload: `replace` starts from `set`, otherwise every
// field in `set` overwrites and every field in `removed` is erased.
Payload ApplyDelta(const Payload& payload, const v1::EntityDelta& delta);

// Applies one event. An entity_created event always starts from an empty payload.
Payload ApplyEvent(const Payload& payload, const v1::StateChangeEvent& event);

// Folds events, which must be ascending by version, from an empty payload.
Payload Fold(const std::vector<v1::StateChangeEvent>& events);

// Smallest merge delta turning `before` into `after`.
v1::EntityDelta ComputeDelta(const Payload& before, const Payload& after);

// Full replacement delta.
v1::EntityDelta ReplaceDelta(const Payload& after);

bool PayloadEquals(const Payload& a, const Payload& b);

} // namespace statecore::store
