#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/util/errors.hpp"

namespace statecore::db::sqlite {

using statecore::db::ErrorCode;
using statecore::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};
using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

constexpr const char* kSnapshotColumns =
    "entity_type,entity_id,version,payload,event_type,actor,committed_at_ms,size_bytes,status";

constexpr const char* kEventColumns =
    "event_id,entity_type,entity_id,version,event_type,delta,metadata,actor,committed_at_ms";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

// Read paths have no Result channel; a broken statement is a storage failure.
Stmt PrepareOrThrow(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw util::StorageError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st);
}

// Steps once; true on SQLITE_ROW, false on SQLITE_DONE, throws otherwise.
bool StepRow(sqlite3* db, sqlite3_stmt* st) {
  const int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw util::StorageError(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

model::SnapshotRecord ReadSnapshot(sqlite3_stmt* st) {
  model::SnapshotRecord r;
  r.entity_type     = ColText(st, 0);
  r.entity_id       = ColText(st, 1);
  r.version         = ColU64(st, 2);
  r.payload_json    = ColText(st, 3);
  r.event_type      = ColText(st, 4);
  r.actor           = ColText(st, 5);
  r.committed_at_ms = ColU64(st, 6);
  r.size_bytes      = ColU64(st, 7);
  r.status          = ColText(st, 8);
  return r;
}

model::EventRecord ReadEvent(sqlite3_stmt* st) {
  model::EventRecord r;
  r.event_id        = ColText(st, 0);
  r.entity_type     = ColText(st, 1);
  r.entity_id       = ColText(st, 2);
  r.version         = ColU64(st, 3);
  r.event_type      = ColText(st, 4);
  r.delta_json      = ColText(st, 5);
  r.metadata_json   = ColText(st, 6);
  r.actor           = ColText(st, 7);
  r.committed_at_ms = ColU64(st, 8);
  return r;
}

std::optional<model::SnapshotRecord> QueryOneSnapshot(sqlite3* db, sqlite3_stmt* st) {
  if (!StepRow(db, st)) return std::nullopt;
  return ReadSnapshot(st);
}

std::vector<model::EventRecord> QueryEvents(sqlite3* db, sqlite3_stmt* st) {
  std::vector<model::EventRecord> out;
  while (StepRow(db, st))
    out.push_back(ReadEvent(st));
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqlitePool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(pool_->Acquire(), false);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginReadOnly() {
  return std::make_unique<SqliteTransaction>(pool_->Acquire(), true);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Version store
// ------------------------------------------------------------------

Result SqliteRepository::InsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  if (TX(t).IsReadOnly()) return Result::Err(ErrorCode::Unsupported, "write in read-only transaction");
  auto* db = TX(t).Handle();

  {
    const std::string sql = std::string("INSERT INTO entity_versions(") + kSnapshotColumns + ") VALUES(?,?,?,?,?,?,?,?,?);";
    sqlite3_stmt*     raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
    Stmt st(raw);
    BindText(raw, 1, r.entity_type);
    BindText(raw, 2, r.entity_id);
    BindU64(raw, 3, r.version);
    BindText(raw, 4, r.payload_json);
    BindText(raw, 5, r.event_type);
    BindText(raw, 6, r.actor);
    BindU64(raw, 7, r.committed_at_ms);
    BindU64(raw, 8, r.size_bytes);
    BindText(raw, 9, r.status);

    auto res = Translate(db, sqlite3_step(raw));
    if (!res) return res;
  }

  // Advance the current-version index; never move it backwards.
  const char* sql =
      "INSERT INTO entity_current(entity_type,entity_id,version,status,committed_at_ms) VALUES(?,?,?,?,?)"
      " ON CONFLICT(entity_type,entity_id) DO UPDATE SET"
      " version=excluded.version, status=excluded.status, committed_at_ms=excluded.committed_at_ms"
      " WHERE excluded.version > entity_current.version;";
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Stmt st(raw);
  BindText(raw, 1, r.entity_type);
  BindText(raw, 2, r.entity_id);
  BindU64(raw, 3, r.version);
  BindText(raw, 4, r.status);
  BindU64(raw, 5, r.committed_at_ms);
  return Translate(db, sqlite3_step(raw));
}

std::optional<model::SnapshotRecord> SqliteRepository::GetSnapshot(Transaction& t, const std::string& entity_type,
                                                                   const std::string& entity_id, uint64_t version) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kSnapshotColumns +
                                    " FROM entity_versions WHERE entity_type=? AND entity_id=? AND version=?;");
  BindText(st.get(), 1, entity_type);
  BindText(st.get(), 2, entity_id);
  BindU64(st.get(), 3, version);
  return QueryOneSnapshot(db, st.get());
}

std::optional<model::SnapshotRecord> SqliteRepository::GetLatestSnapshot(Transaction& t, const std::string& entity_type,
                                                                         const std::string& entity_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kSnapshotColumns +
                                    " FROM entity_versions WHERE entity_type=? AND entity_id=?"
                                    " ORDER BY version DESC LIMIT 1;");
  BindText(st.get(), 1, entity_type);
  BindText(st.get(), 2, entity_id);
  return QueryOneSnapshot(db, st.get());
}

std::optional<model::SnapshotRecord> SqliteRepository::GetSnapshotAtTime(Transaction& t, const std::string& entity_type,
                                                                         const std::string& entity_id, uint64_t at_ms) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kSnapshotColumns +
                                    " FROM entity_versions WHERE entity_type=? AND entity_id=? AND committed_at_ms<=?"
                                    " ORDER BY version DESC LIMIT 1;");
  BindText(st.get(), 1, entity_type);
  BindText(st.get(), 2, entity_id);
  BindU64(st.get(), 3, at_ms);
  return QueryOneSnapshot(db, st.get());
}

std::optional<model::EntityHeadRecord> SqliteRepository::GetCurrent(Transaction& t, const std::string& entity_type,
                                                                    const std::string& entity_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db,
                            "SELECT entity_type,entity_id,version,status,committed_at_ms FROM entity_current"
                             " WHERE entity_type=? AND entity_id=?;");
  BindText(st.get(), 1, entity_type);
  BindText(st.get(), 2, entity_id);
  if (!StepRow(db, st.get())) return std::nullopt;

  model::EntityHeadRecord head;
  head.entity_type     = ColText(st.get(), 0);
  head.entity_id       = ColText(st.get(), 1);
  head.version         = ColU64(st.get(), 2);
  head.status          = ColText(st.get(), 3);
  head.committed_at_ms = ColU64(st.get(), 4);
  return head;
}

std::vector<model::SnapshotRecord> SqliteRepository::ListVersions(Transaction& t, const std::string& entity_type,
                                                                  const std::string& entity_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db,
                            "SELECT entity_type,entity_id,version,'',event_type,actor,committed_at_ms,size_bytes,status"
                             " FROM entity_versions WHERE entity_type=? AND entity_id=? ORDER BY version ASC;");
  BindText(st.get(), 1, entity_type);
  BindText(st.get(), 2, entity_id);

  std::vector<model::SnapshotRecord> out;
  while (StepRow(db, st.get()))
    out.push_back(ReadSnapshot(st.get()));
  return out;
}

std::vector<model::SnapshotRecord> SqliteRepository::ListCurrent(Transaction& t, const std::string& entity_type,
                                                                 const Pagination& pagination, bool include_deleted) {
  auto*       db  = TX(t).Handle();
  std::string sql = "SELECT v.entity_type,v.entity_id,v.version,v.payload,v.event_type,v.actor,v.committed_at_ms,v.size_bytes,v.status"
                    " FROM entity_current c JOIN entity_versions v"
                    " ON v.entity_type=c.entity_type AND v.entity_id=c.entity_id AND v.version=c.version"
                    " WHERE c.entity_type=?";
  if (!include_deleted) sql += " AND c.status<>'deleted'";
  sql += " ORDER BY c.entity_id ASC LIMIT ? OFFSET ?;";

  auto st = PrepareOrThrow(db, sql);
  BindText(st.get(), 1, entity_type);
  BindU64(st.get(), 2, pagination.limit);
  BindU64(st.get(), 3, pagination.offset);

  std::vector<model::SnapshotRecord> out;
  while (StepRow(db, st.get()))
    out.push_back(ReadSnapshot(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Event log
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvent(Transaction& t, const model::EventRecord& r) {
  if (TX(t).IsReadOnly()) return Result::Err(ErrorCode::Unsupported, "write in read-only transaction");
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO entity_events(") + kEventColumns + ") VALUES(?,?,?,?,?,?,?,?,?);";
  sqlite3_stmt*     raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Stmt st(raw);
  BindText(raw, 1, r.event_id);
  BindText(raw, 2, r.entity_type);
  BindText(raw, 3, r.entity_id);
  BindU64(raw, 4, r.version);
  BindText(raw, 5, r.event_type);
  BindText(raw, 6, r.delta_json);
  BindText(raw, 7, r.metadata_json);
  BindText(raw, 8, r.actor);
  BindU64(raw, 9, r.committed_at_ms);
  return Translate(db, sqlite3_step(raw));
}

std::vector<model::EventRecord> SqliteRepository::ListEvents(Transaction& t, const std::string& entity_type, const std::string& entity_id,
                                                             uint64_t from_version, std::optional<uint64_t> to_version) {
  auto*       db  = TX(t).Handle();
  std::string sql = std::string("SELECT ") + kEventColumns + " FROM entity_events WHERE entity_type=? AND entity_id=? AND version>=?";
  if (to_version) sql += " AND version<=?";
  sql += " ORDER BY version ASC;";

  auto st = PrepareOrThrow(db, sql);
  BindText(st.get(), 1, entity_type);
  BindText(st.get(), 2, entity_id);
  BindU64(st.get(), 3, from_version);
  if (to_version) BindU64(st.get(), 4, *to_version);
  return QueryEvents(db, st.get());
}

std::vector<model::EventRecord> SqliteRepository::ListEventsByTime(Transaction& t, const std::string& entity_type,
                                                                   const std::string& entity_id, uint64_t from_ms,
                                                                   std::optional<uint64_t> to_ms) {
  auto*       db  = TX(t).Handle();
  std::string sql =
      std::string("SELECT ") + kEventColumns + " FROM entity_events WHERE entity_type=? AND entity_id=? AND committed_at_ms>=?";
  if (to_ms) sql += " AND committed_at_ms<=?";
  sql += " ORDER BY version ASC;";

  auto st = PrepareOrThrow(db, sql);
  BindText(st.get(), 1, entity_type);
  BindText(st.get(), 2, entity_id);
  BindU64(st.get(), 3, from_ms);
  if (to_ms) BindU64(st.get(), 4, *to_ms);
  return QueryEvents(db, st.get());
}

} // namespace statecore::db::sqlite
