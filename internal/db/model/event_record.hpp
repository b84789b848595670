#pragma once

#include <cstdint>
#include <string>

namespace statecore::db::model {

// Immutable event log row, keyed by (entity_type, entity_id, version).
struct EventRecord {
  std::string event_id;
  std::string entity_type;
  std::string entity_id;
  uint64_t    version = 0;

  std::string event_type;
  std::string delta_json;
  std::string metadata_json;
  std::string actor;

  uint64_t committed_at_ms = 0;
};

}
