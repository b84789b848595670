#include "codec.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/model/entity_type.hpp"
#include "internal/model/lifecycle.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace statecore::store {

namespace {

template <typename Message>
std::string ToJson(const Message& message, const char* what) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw util::StorageError(std::string("serialize ") + what + ": " + std::string(status.message()));
  }
  return json;
}

template <typename Message>
Message FromJson(const std::string& json, const char* what) {
  Message message;
  if (json.empty()) return message;
  auto status = google::protobuf::util::JsonStringToMessage(json, &message);
  if (!status.ok()) {
    throw util::StorageError(std::string("corrupt ") + what + ": " + std::string(status.message()));
  }
  return message;
}

v1::EntityType TypeFromName(const std::string& name) {
  auto type = model::ParseEntityType(name);
  if (!type) throw util::StorageError("unknown entity type in storage: " + name);
  return *type;
}

} // namespace

std::string PayloadToJson(const google::protobuf::Struct& payload) {
  return ToJson(payload, "payload");
}

google::protobuf::Struct PayloadFromJson(const std::string& json) {
  return FromJson<google::protobuf::Struct>(json, "payload");
}

db::model::SnapshotRecord ToRecord(const v1::EntitySnapshot& snapshot) {
  db::model::SnapshotRecord r;
  r.entity_type     = std::string(model::ToString(snapshot.key().type()));
  r.entity_id       = snapshot.key().id();
  r.version         = snapshot.version();
  r.payload_json    = PayloadToJson(snapshot.payload());
  r.event_type      = snapshot.event_type();
  r.actor           = snapshot.actor();
  r.committed_at_ms = util::ProtoToMillis(snapshot.committed_at());
  r.size_bytes      = r.payload_json.size();
  r.status          = std::string(model::StatusOf(snapshot.payload()));
  return r;
}

v1::EntitySnapshot FromRecord(const db::model::SnapshotRecord& record) {
  v1::EntitySnapshot s;
  s.mutable_key()->set_type(TypeFromName(record.entity_type));
  s.mutable_key()->set_id(record.entity_id);
  s.set_version(record.version);
  *s.mutable_payload()      = PayloadFromJson(record.payload_json);
  *s.mutable_committed_at() = util::MillisToProto(record.committed_at_ms);
  s.set_actor(record.actor);
  s.set_event_type(record.event_type);
  return s;
}

v1::VersionInfo ToVersionInfo(const db::model::SnapshotRecord& record) {
  v1::VersionInfo info;
  info.set_version(record.version);
  *info.mutable_committed_at() = util::MillisToProto(record.committed_at_ms);
  info.set_actor(record.actor);
  info.set_event_type(record.event_type);
  info.set_size_bytes(record.size_bytes);
  return info;
}

db::model::EventRecord ToRecord(const v1::StateChangeEvent& event) {
  db::model::EventRecord r;
  r.event_id    = event.event_id();
  r.entity_type = std::string(model::ToString(event.key().type()));
  r.entity_id   = event.key().id();
  r.version     = event.version();
  r.event_type  = event.event_type();
  r.delta_json  = ToJson(event.delta(), "delta");

  google::protobuf::Struct metadata;
  for (const auto& [k, v] : event.metadata()) {
    (*metadata.mutable_fields())[k].set_string_value(v);
  }
  r.metadata_json   = ToJson(metadata, "metadata");
  r.actor           = event.actor();
  r.committed_at_ms = util::ProtoToMillis(event.committed_at());
  return r;
}

v1::StateChangeEvent FromRecord(const db::model::EventRecord& record) {
  v1::StateChangeEvent e;
  e.set_event_id(record.event_id);
  e.mutable_key()->set_type(TypeFromName(record.entity_type));
  e.mutable_key()->set_id(record.entity_id);
  e.set_version(record.version);
  e.set_event_type(record.event_type);
  *e.mutable_delta() = FromJson<v1::EntityDelta>(record.delta_json, "delta");

  const auto metadata = FromJson<google::protobuf::Struct>(record.metadata_json, "metadata");
  for (const auto& [k, v] : metadata.fields()) {
    (*e.mutable_metadata())[k] = v.string_value();
  }
  e.set_actor(record.actor);
  *e.mutable_committed_at() = util::MillisToProto(record.committed_at_ms);
  return e;
}

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Unsupported:
      throw util::InvalidState(message);
    default:
      throw util::StorageError(message + " (" + db::ToString(result.code) + ")");
  }
}

} // namespace statecore::store
