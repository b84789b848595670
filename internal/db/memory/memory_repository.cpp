#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace statecore::db::memory {

namespace {

template <typename Row>
bool HasVersion(const std::vector<Row>& rows, uint64_t version) {
  return std::any_of(rows.begin(), rows.end(), [version](const Row& r) { return r.version == version; });
}

template <typename Row>
void SortByVersion(std::vector<Row>& rows) {
  std::sort(rows.begin(), rows.end(), [](const Row& a, const Row& b) { return a.version < b.version; });
}

model::EntityHeadRecord HeadOf(const model::SnapshotRecord& s) {
  model::EntityHeadRecord head;
  head.entity_type     = s.entity_type;
  head.entity_id       = s.entity_id;
  head.version         = s.version;
  head.status          = s.status;
  head.committed_at_ms = s.committed_at_ms;
  return head;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, false);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginReadOnly() {
  return std::make_unique<MemoryTransaction>(*this, true);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

MemoryRepository::History MemoryRepository::View(Transaction& t, const std::string& entity_type, const std::string& entity_id) {
  History view;
  {
    std::scoped_lock lock(mutex_);
    auto             type_it = committed_.find(entity_type);
    if (type_it != committed_.end()) {
      auto it = type_it->second.find(entity_id);
      if (it != type_it->second.end()) view = it->second;
    }
  }

  for (const auto& s : TX(t).PendingSnapshots())
    if (s.entity_type == entity_type && s.entity_id == entity_id) view.versions.push_back(s);
  for (const auto& e : TX(t).PendingEvents())
    if (e.entity_type == entity_type && e.entity_id == entity_id) view.events.push_back(e);

  SortByVersion(view.versions);
  SortByVersion(view.events);
  return view;
}

const MemoryRepository::History* MemoryRepository::CommittedLocked(const std::string& entity_type, const std::string& entity_id) const {
  auto type_it = committed_.find(entity_type);
  if (type_it == committed_.end()) return nullptr;
  auto it = type_it->second.find(entity_id);
  return it == type_it->second.end() ? nullptr : &it->second;
}

std::optional<model::SnapshotRecord> MemoryRepository::FindSnapshot(Transaction& t, const std::string& entity_type,
                                                                    const std::string& entity_id, std::optional<uint64_t> version) {
  // Pending rows are always newer than committed ones.
  const model::SnapshotRecord* pending = nullptr;
  for (const auto& s : TX(t).PendingSnapshots()) {
    if (s.entity_type != entity_type || s.entity_id != entity_id) continue;
    if (version ? s.version == *version : (!pending || s.version > pending->version)) pending = &s;
  }
  if (pending) return *pending;

  std::scoped_lock lock(mutex_);
  const auto*      history = CommittedLocked(entity_type, entity_id);
  if (!history || history->versions.empty()) return std::nullopt;
  if (!version) return history->versions.back();

  // Committed versions are dense from 1.
  if (*version == 0 || *version > history->versions.size()) return std::nullopt;
  const auto& row = history->versions[*version - 1];
  if (row.version != *version) return std::nullopt;
  return row;
}

bool MemoryRepository::HasEvent(Transaction& t, const std::string& entity_type, const std::string& entity_id, uint64_t version) {
  for (const auto& e : TX(t).PendingEvents())
    if (e.entity_type == entity_type && e.entity_id == entity_id && e.version == version) return true;

  std::scoped_lock lock(mutex_);
  const auto*      history = CommittedLocked(entity_type, entity_id);
  return history && HasVersion(history->events, version);
}

Result MemoryRepository::InsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  if (TX(t).IsReadOnly()) return Result::Err(ErrorCode::Unsupported, "write in read-only transaction");
  if (FindSnapshot(t, r.entity_type, r.entity_id, r.version)) {
    return Result::Err(ErrorCode::ConstraintViolation, "snapshot version already exists");
  }
  TX(t).PendingSnapshots().push_back(r);
  return Result::Ok();
}

std::optional<model::SnapshotRecord> MemoryRepository::GetSnapshot(Transaction& t, const std::string& entity_type,
                                                                   const std::string& entity_id, uint64_t version) {
  return FindSnapshot(t, entity_type, entity_id, version);
}

std::optional<model::SnapshotRecord> MemoryRepository::GetLatestSnapshot(Transaction& t, const std::string& entity_type,
                                                                         const std::string& entity_id) {
  return FindSnapshot(t, entity_type, entity_id, std::nullopt);
}

std::optional<model::SnapshotRecord> MemoryRepository::GetSnapshotAtTime(Transaction& t, const std::string& entity_type,
                                                                         const std::string& entity_id, uint64_t at_ms) {
  const auto                           view = View(t, entity_type, entity_id);
  std::optional<model::SnapshotRecord> found;
  for (const auto& s : view.versions)
    if (s.committed_at_ms <= at_ms) found = s;
  return found;
}

std::optional<model::EntityHeadRecord> MemoryRepository::GetCurrent(Transaction& t, const std::string& entity_type,
                                                                    const std::string& entity_id) {
  const auto latest = FindSnapshot(t, entity_type, entity_id, std::nullopt);
  if (!latest) return std::nullopt;
  return HeadOf(*latest);
}

std::vector<model::SnapshotRecord> MemoryRepository::ListVersions(Transaction& t, const std::string& entity_type,
                                                                  const std::string& entity_id) {
  auto view = View(t, entity_type, entity_id);
  for (auto& s : view.versions)
    s.payload_json.clear();
  return view.versions;
}

std::vector<model::SnapshotRecord> MemoryRepository::ListCurrent(Transaction& t, const std::string& entity_type,
                                                                 const Pagination& pagination, bool include_deleted) {
  std::vector<std::string> ids;
  {
    std::scoped_lock lock(mutex_);
    auto             type_it = committed_.find(entity_type);
    if (type_it != committed_.end()) {
      for (const auto& [id, history] : type_it->second)
        if (!history.versions.empty()) ids.push_back(id);
    }
  }
  for (const auto& s : TX(t).PendingSnapshots())
    if (s.entity_type == entity_type) ids.push_back(s.entity_id);
  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

  std::vector<model::SnapshotRecord> out;
  std::size_t                        skipped = 0;
  for (const auto& id : ids) {
    if (out.size() >= pagination.limit) break;
    auto latest = GetLatestSnapshot(t, entity_type, id);
    if (!latest) continue;
    if (!include_deleted && latest->status == "deleted") continue;
    if (skipped < pagination.offset) {
      ++skipped;
      continue;
    }
    out.push_back(std::move(*latest));
  }
  return out;
}

Result MemoryRepository::AppendEvent(Transaction& t, const model::EventRecord& r) {
  if (TX(t).IsReadOnly()) return Result::Err(ErrorCode::Unsupported, "write in read-only transaction");
  if (HasEvent(t, r.entity_type, r.entity_id, r.version)) {
    return Result::Err(ErrorCode::ConstraintViolation, "event version already exists");
  }
  TX(t).PendingEvents().push_back(r);
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ListEvents(Transaction& t, const std::string& entity_type, const std::string& entity_id,
                                                             uint64_t from_version, std::optional<uint64_t> to_version) {
  const auto                      view = View(t, entity_type, entity_id);
  std::vector<model::EventRecord> out;
  for (const auto& e : view.events) {
    if (e.version < from_version) continue;
    if (to_version && e.version > *to_version) break;
    out.push_back(e);
  }
  return out;
}

std::vector<model::EventRecord> MemoryRepository::ListEventsByTime(Transaction& t, const std::string& entity_type,
                                                                   const std::string& entity_id, uint64_t from_ms,
                                                                   std::optional<uint64_t> to_ms) {
  const auto                      view = View(t, entity_type, entity_id);
  std::vector<model::EventRecord> out;
  for (const auto& e : view.events) {
    if (e.committed_at_ms < from_ms) continue;
    if (to_ms && e.committed_at_ms > *to_ms) continue;
    out.push_back(e);
  }
  return out;
}

}
