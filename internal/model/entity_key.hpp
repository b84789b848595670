#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/model/entity_type.hpp"
#include "statecore/v1/entity.pb.h"

namespace statecore::model {

using EntityKey = statecore::v1::EntityKey;

inline EntityKey MakeKey(EntityType type, std::string id) {
  EntityKey key;
  key.set_type(type);
  key.set_id(std::move(id));
  return key;
}

// "task:T1". Used for cache keys and as the default logical lock key.
inline std::string KeyString(const EntityKey& key) {
  return std::string(ToString(key.type())) + ":" + key.id();
}

// Inverse of KeyString. nullopt for malformed input or an unknown type.
inline std::optional<EntityKey> ParseKeyString(std::string_view text) {
  const auto colon = text.find(':');
  if (colon == std::string_view::npos || colon + 1 == text.size()) return std::nullopt;
  auto type = ParseEntityType(text.substr(0, colon));
  if (!type) return std::nullopt;
  return MakeKey(*type, std::string(text.substr(colon + 1)));
}

inline bool SameKey(const EntityKey& a, const EntityKey& b) {
  return a.type() == b.type() && a.id() == b.id();
}

}  // namespace statecore::model
