#include "event_log.hpp"

#include <string>

#include "codec.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace statecore::store {

namespace {

std::string TypeName(const model::EntityKey& key) {
  return std::string(model::ToString(key.type()));
}

std::vector<v1::StateChangeEvent> Decode(const std::vector<db::model::EventRecord>& records) {
  std::vector<v1::StateChangeEvent> out;
  out.reserve(records.size());
  for (const auto& r : records) {
    out.push_back(FromRecord(r));
  }
  return out;
}

} // namespace

EventLog::EventLog(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

db::Result EventLog::Append(db::Transaction& tx, v1::StateChangeEvent& event) {
  if (event.event_id().empty()) event.set_event_id(util::GenerateUUIDString());
  return repository_->AppendEvent(tx, ToRecord(event));
}

std::vector<v1::StateChangeEvent> EventLog::List(const model::EntityKey& key, std::optional<uint64_t> up_to_version) {
  return ListRange(key, 1, up_to_version);
}

std::vector<v1::StateChangeEvent> EventLog::ListRange(const model::EntityKey& key, uint64_t from_version,
                                                      std::optional<uint64_t> to_version) {
  auto tx      = repository_->BeginReadOnly();
  auto records = repository_->ListEvents(*tx, TypeName(key), key.id(), from_version, to_version);
  tx->Commit();
  return Decode(records);
}

std::vector<v1::StateChangeEvent> EventLog::ListByTime(const model::EntityKey& key, uint64_t from_ms, std::optional<uint64_t> to_ms) {
  auto tx      = repository_->BeginReadOnly();
  auto records = repository_->ListEventsByTime(*tx, TypeName(key), key.id(), from_ms, to_ms);
  tx->Commit();
  return Decode(records);
}

std::optional<Reconstruction> EventLog::Reconstruct(const model::EntityKey& key, std::optional<uint64_t> up_to_version) {
  return FoldAll(List(key, up_to_version));
}

std::optional<Reconstruction> EventLog::ReconstructAtTime(const model::EntityKey& key, uint64_t at_ms) {
  return FoldAll(ListByTime(key, 0, at_ms));
}

std::optional<Reconstruction> EventLog::FoldAll(const std::vector<v1::StateChangeEvent>& events) {
  if (events.empty()) return std::nullopt;

  Reconstruction out;
  out.payload         = Fold(events);
  out.version         = events.back().version();
  out.committed_at_ms = util::ProtoToMillis(events.back().committed_at());
  return out;
}

} // namespace statecore::store
