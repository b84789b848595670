#pragma once

#include <string_view>

#include "google/protobuf/struct.pb.h"

namespace statecore::model {

inline constexpr std::string_view kEventCreated  = "entity_created";
inline constexpr std::string_view kEventUpdated  = "entity_updated";
inline constexpr std::string_view kEventDeleted  = "entity_deleted";
inline constexpr std::string_view kEventRollback = "rollback";

inline constexpr std::string_view kStatusField   = "status";
inline constexpr std::string_view kStatusDeleted = "deleted";

// Entities are never physically removed; deletion is this terminal status.
inline bool IsTerminal(const google::protobuf::Struct& payload) {
  const auto it = payload.fields().find(std::string(kStatusField));
  return it != payload.fields().end() && it->second.has_string_value() && it->second.string_value() == kStatusDeleted;
}

inline std::string_view StatusOf(const google::protobuf::Struct& payload) {
  const auto it = payload.fields().find(std::string(kStatusField));
  if (it == payload.fields().end() || !it->second.has_string_value()) return {};
  return it->second.string_value();
}

}  // namespace statecore::model
