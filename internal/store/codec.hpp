#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/snapshot_record.hpp"
#include "statecore/v1/entity.pb.h"
#include "statecore/v1/event.pb.h"

namespace statecore::store {

/*
  Conversions between repository rows and the v1 protobuf types.
  JSON is the persisted form of payloads, deltas and metadata.
*/

std::string                 PayloadToJson(const google::protobuf::Struct& payload);
google::protobuf::Struct    PayloadFromJson(const std::string& json);

db::model::SnapshotRecord   ToRecord(const v1::EntitySnapshot& snapshot);
v1::EntitySnapshot          FromRecord(const db::model::SnapshotRecord& record);
v1::VersionInfo             ToVersionInfo(const db::model::SnapshotRecord& record);

db::model::EventRecord      ToRecord(const v1::StateChangeEvent& event);
v1::StateChangeEvent        FromRecord(const db::model::EventRecord& record);

// Translates a failed repository Result into a util exception.
void ThrowIfDbError(const db::Result& result, const std::string& context);

} // namespace statecore::store
