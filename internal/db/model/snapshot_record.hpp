#pragma once

#include <cstdint>
#include <string>

namespace statecore::db::model {

/*
  Persistent entity version row.

  IMPORTANT:
  - (entity_type, entity_id, version) is the primary key.
  - payload_json is the serialized google.protobuf.Struct.
  - Rows are immutable once committed.
*/

struct SnapshotRecord {
  std::string entity_type;
  std::string entity_id;
  uint64_t    version = 0;

  std::string payload_json;
  std::string event_type;
  std::string actor;

  uint64_t committed_at_ms = 0;
  uint64_t size_bytes      = 0;

  // Denormalized payload status, kept in the current-version index.
  std::string status;
};

// Row of the current-version index.
struct EntityHeadRecord {
  std::string entity_type;
  std::string entity_id;
  uint64_t    version         = 0;
  std::string status;
  uint64_t    committed_at_ms = 0;
};

}
