#include "dependency_table.hpp"

namespace statecore::cache {

DependencyTable DependencyTable::WithDefaults() {
  DependencyTable table;
  table.AddRule({statecore::v1::ENTITY_TYPE_TASK, "workflow_id", statecore::v1::ENTITY_TYPE_WORKFLOW});
  table.AddRule({statecore::v1::ENTITY_TYPE_TASK, "assigned_agent", statecore::v1::ENTITY_TYPE_AGENT});
  return table;
}

void DependencyTable::AddRule(DependencyRule rule) {
  for (const auto& existing : rules_) {
    if (existing.source_type == rule.source_type && existing.field == rule.field && existing.target_type == rule.target_type) return;
  }
  rules_.push_back(std::move(rule));
}

std::vector<model::EntityKey> DependencyTable::Dependents(const model::EntityKey& source, const google::protobuf::Struct& payload) const {
  std::vector<model::EntityKey> out;
  for (const auto& rule : rules_) {
    if (rule.source_type != source.type()) continue;

    auto it = payload.fields().find(rule.field);
    if (it == payload.fields().end()) continue;

    const auto& value = it->second;
    if (value.has_string_value() && !value.string_value().empty()) {
      out.push_back(model::MakeKey(rule.target_type, value.string_value()));
    } else if (value.has_list_value()) {
      for (const auto& item : value.list_value().values()) {
        if (item.has_string_value() && !item.string_value().empty()) out.push_back(model::MakeKey(rule.target_type, item.string_value()));
      }
    }
  }
  return out;
}

} // namespace statecore::cache
