#pragma once

#include <string>
#include <vector>

#include "google/protobuf/struct.pb.h"
#include "internal/model/entity_key.hpp"

namespace statecore::cache {

// A payload field of `source_type` entities that names a `target_type` entity.
struct DependencyRule {
  model::EntityType source_type;
  std::string       field;
  model::EntityType target_type;
};

/*
  Declared dependencies used for cache invalidation: mutating a source
  entity also evicts every entity its payload references through a rule.
  Field values may be a string id or a list of string ids.
*/
class DependencyTable {
 public:
  // task.workflow_id -> workflow, task.assigned_agent -> agent
  static DependencyTable WithDefaults();

  void AddRule(DependencyRule rule);

  std::vector<model::EntityKey> Dependents(const model::EntityKey& source, const google::protobuf::Struct& payload) const;

  const std::vector<DependencyRule>& Rules() const {
    return rules_;
  }

 private:
  std::vector<DependencyRule> rules_;
};

} // namespace statecore::cache
