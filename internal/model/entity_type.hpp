#pragma once

#include <optional>
#include <string_view>

#include "statecore/v1/entity.pb.h"

namespace statecore::model {

using EntityType = statecore::v1::EntityType;

// Storage name of an entity type; partitions the key space in every backend.
constexpr std::string_view ToString(EntityType type) {
  switch (type) {
    case statecore::v1::ENTITY_TYPE_WORKFLOW:
      return "workflow";
    case statecore::v1::ENTITY_TYPE_AGENT:
      return "agent";
    case statecore::v1::ENTITY_TYPE_TASK:
      return "task";
    case statecore::v1::ENTITY_TYPE_RESOURCE:
      return "resource";
    case statecore::v1::ENTITY_TYPE_SYSTEM:
      return "system";
    case statecore::v1::ENTITY_TYPE_UNSPECIFIED:
    default:
      return "unspecified";
  }
}

constexpr std::optional<EntityType> ParseEntityType(std::string_view name) {
  if (name == "workflow") return statecore::v1::ENTITY_TYPE_WORKFLOW;
  if (name == "agent") return statecore::v1::ENTITY_TYPE_AGENT;
  if (name == "task") return statecore::v1::ENTITY_TYPE_TASK;
  if (name == "resource") return statecore::v1::ENTITY_TYPE_RESOURCE;
  if (name == "system") return statecore::v1::ENTITY_TYPE_SYSTEM;
  return std::nullopt;
}

}  // namespace statecore::model
