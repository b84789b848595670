#include "version_store.hpp"

#include <string>

#include "codec.hpp"
#include "internal/util/errors.hpp"

namespace statecore::store {

namespace {

std::string TypeName(const model::EntityKey& key) {
  return std::string(model::ToString(key.type()));
}

} // namespace

VersionStore::VersionStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::optional<v1::EntitySnapshot> VersionStore::Get(const model::EntityKey& key, std::optional<uint64_t> version) {
  auto tx     = repository_->BeginReadOnly();
  auto result = Get(*tx, key, version);
  tx->Commit();
  return result;
}

std::optional<v1::EntitySnapshot> VersionStore::GetAtTime(const model::EntityKey& key, uint64_t at_ms) {
  auto tx     = repository_->BeginReadOnly();
  auto record = repository_->GetSnapshotAtTime(*tx, TypeName(key), key.id(), at_ms);
  tx->Commit();
  if (!record) return std::nullopt;
  return FromRecord(*record);
}

std::optional<uint64_t> VersionStore::CurrentVersion(const model::EntityKey& key) {
  auto tx   = repository_->BeginReadOnly();
  auto head = Current(*tx, key);
  tx->Commit();
  if (!head) return std::nullopt;
  return head->version;
}

std::vector<v1::VersionInfo> VersionStore::History(const model::EntityKey& key) {
  auto tx      = repository_->BeginReadOnly();
  auto records = repository_->ListVersions(*tx, TypeName(key), key.id());
  tx->Commit();

  std::vector<v1::VersionInfo> out;
  out.reserve(records.size());
  for (const auto& r : records) {
    out.push_back(ToVersionInfo(r));
  }
  return out;
}

std::vector<v1::EntitySnapshot> VersionStore::ListCurrent(model::EntityType type, const db::Pagination& pagination, bool include_deleted) {
  auto tx      = repository_->BeginReadOnly();
  auto records = repository_->ListCurrent(*tx, std::string(model::ToString(type)), pagination, include_deleted);
  tx->Commit();

  std::vector<v1::EntitySnapshot> out;
  out.reserve(records.size());
  for (const auto& r : records) {
    out.push_back(FromRecord(r));
  }
  return out;
}

std::optional<v1::EntitySnapshot> VersionStore::Get(db::Transaction& tx, const model::EntityKey& key, std::optional<uint64_t> version) {
  auto record = version ? repository_->GetSnapshot(tx, TypeName(key), key.id(), *version)
                        : repository_->GetLatestSnapshot(tx, TypeName(key), key.id());
  if (!record) return std::nullopt;
  return FromRecord(*record);
}

std::optional<db::model::EntityHeadRecord> VersionStore::Current(db::Transaction& tx, const model::EntityKey& key) {
  return repository_->GetCurrent(tx, TypeName(key), key.id());
}

db::Result VersionStore::Put(db::Transaction& tx, const v1::EntitySnapshot& snapshot) {
  const auto     head    = Current(tx, snapshot.key());
  const uint64_t current = head ? head->version : 0;

  if (snapshot.version() <= current) {
    return db::Result::Err(db::ErrorCode::ConstraintViolation, model::KeyString(snapshot.key()) + " already at version " +
                                                                   std::to_string(current));
  }
  if (snapshot.version() != current + 1) {
    throw util::ConflictError("non-sequential version for " + model::KeyString(snapshot.key()) + ": current " +
                              std::to_string(current) + ", put " + std::to_string(snapshot.version()));
  }

  return repository_->InsertSnapshot(tx, ToRecord(snapshot));
}

} // namespace statecore::store
