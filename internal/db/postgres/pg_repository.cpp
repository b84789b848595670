#include "pg_repository.hpp"

#include "internal/util/errors.hpp"

namespace statecore::db::postgres {

namespace {

constexpr const char* kSnapshotColumns =
    "entity_type,entity_id,version,payload,event_type,actor,committed_at_ms,size_bytes,status";

constexpr const char* kEventColumns =
    "event_id,entity_type,entity_id,version,event_type,delta,metadata,actor,committed_at_ms";

model::SnapshotRecord ReadSnapshot(const pqxx::row& row) {
  model::SnapshotRecord r;
  r.entity_type     = row[0].c_str();
  r.entity_id       = row[1].c_str();
  r.version         = row[2].as<uint64_t>();
  r.payload_json    = row[3].is_null() ? "" : row[3].c_str();
  r.event_type      = row[4].c_str();
  r.actor           = row[5].c_str();
  r.committed_at_ms = row[6].as<uint64_t>();
  r.size_bytes      = row[7].as<uint64_t>();
  r.status          = row[8].c_str();
  return r;
}

model::EventRecord ReadEvent(const pqxx::row& row) {
  model::EventRecord r;
  r.event_id        = row[0].c_str();
  r.entity_type     = row[1].c_str();
  r.entity_id       = row[2].c_str();
  r.version         = row[3].as<uint64_t>();
  r.event_type      = row[4].c_str();
  r.delta_json      = row[5].c_str();
  r.metadata_json   = row[6].c_str();
  r.actor           = row[7].c_str();
  r.committed_at_ms = row[8].as<uint64_t>();
  return r;
}

std::optional<model::SnapshotRecord> FirstSnapshot(const pqxx::result& res) {
  if (res.empty()) return std::nullopt;
  return ReadSnapshot(res[0]);
}

template <typename Fn>
auto ReadOrThrow(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::failure& e) {
    throw util::StorageError(std::string("postgres read failed: ") + e.what());
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool, std::chrono::milliseconds statement_timeout)
    : pool_(std::move(pool)), statement_timeout_(statement_timeout) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_, false, statement_timeout_);
}

std::unique_ptr<db::Transaction> PgRepository::BeginReadOnly() {
  return std::make_unique<PgTransaction>(pool_, true, statement_timeout_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Conflict, e.what());
  if (dynamic_cast<const pqxx::query_canceled*>(&e)) return Result::Err(ErrorCode::Timeout, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Version store
// ------------------------------------------------------------------

Result PgRepository::InsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  if (TX(t).IsReadOnly()) return Result::Err(ErrorCode::Unsupported, "write in read-only transaction");
  try {
    auto& w = TX(t).Work();
    w.exec_params(std::string("INSERT INTO entity_versions(") + kSnapshotColumns + ") VALUES($1,$2,$3,$4::jsonb,$5,$6,$7,$8,$9);",
                  r.entity_type, r.entity_id, r.version, r.payload_json, r.event_type, r.actor, r.committed_at_ms, r.size_bytes,
                  r.status);
    w.exec_params(
        "INSERT INTO entity_current(entity_type,entity_id,version,status,committed_at_ms) VALUES($1,$2,$3,$4,$5) "
        "ON CONFLICT(entity_type,entity_id) DO UPDATE SET version=EXCLUDED.version,status=EXCLUDED.status,"
        "committed_at_ms=EXCLUDED.committed_at_ms WHERE EXCLUDED.version > entity_current.version;",
        r.entity_type, r.entity_id, r.version, r.status, r.committed_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SnapshotRecord> PgRepository::GetSnapshot(Transaction& t, const std::string& entity_type, const std::string& entity_id,
                                                               uint64_t version) {
  return ReadOrThrow([&] {
    return FirstSnapshot(TX(t).Work().exec_params(
        std::string("SELECT ") + kSnapshotColumns + " FROM entity_versions WHERE entity_type=$1 AND entity_id=$2 AND version=$3;",
        entity_type, entity_id, version));
  });
}

std::optional<model::SnapshotRecord> PgRepository::GetLatestSnapshot(Transaction& t, const std::string& entity_type,
                                                                     const std::string& entity_id) {
  return ReadOrThrow([&] {
    return FirstSnapshot(TX(t).Work().exec_params(std::string("SELECT ") + kSnapshotColumns +
                                                      " FROM entity_versions WHERE entity_type=$1 AND entity_id=$2"
                                                      " ORDER BY version DESC LIMIT 1;",
                                                  entity_type, entity_id));
  });
}

std::optional<model::SnapshotRecord> PgRepository::GetSnapshotAtTime(Transaction& t, const std::string& entity_type,
                                                                     const std::string& entity_id, uint64_t at_ms) {
  return ReadOrThrow([&] {
    return FirstSnapshot(TX(t).Work().exec_params(std::string("SELECT ") + kSnapshotColumns +
                                                      " FROM entity_versions WHERE entity_type=$1 AND entity_id=$2"
                                                      " AND committed_at_ms<=$3 ORDER BY version DESC LIMIT 1;",
                                                  entity_type, entity_id, at_ms));
  });
}

std::optional<model::EntityHeadRecord> PgRepository::GetCurrent(Transaction& t, const std::string& entity_type,
                                                                const std::string& entity_id) {
  return ReadOrThrow([&]() -> std::optional<model::EntityHeadRecord> {
    auto res = TX(t).Work().exec_params(
        "SELECT entity_type,entity_id,version,status,committed_at_ms FROM entity_current WHERE entity_type=$1 AND entity_id=$2;",
        entity_type, entity_id);
    if (res.empty()) return std::nullopt;

    model::EntityHeadRecord head;
    head.entity_type     = res[0][0].c_str();
    head.entity_id       = res[0][1].c_str();
    head.version         = res[0][2].as<uint64_t>();
    head.status          = res[0][3].c_str();
    head.committed_at_ms = res[0][4].as<uint64_t>();
    return head;
  });
}

std::vector<model::SnapshotRecord> PgRepository::ListVersions(Transaction& t, const std::string& entity_type,
                                                              const std::string& entity_id) {
  return ReadOrThrow([&] {
    auto res = TX(t).Work().exec_params(
        "SELECT entity_type,entity_id,version,NULL,event_type,actor,committed_at_ms,size_bytes,status"
        " FROM entity_versions WHERE entity_type=$1 AND entity_id=$2 ORDER BY version ASC;",
        entity_type, entity_id);

    std::vector<model::SnapshotRecord> out;
    out.reserve(res.size());
    for (const auto& row : res)
      out.push_back(ReadSnapshot(row));
    return out;
  });
}

std::vector<model::SnapshotRecord> PgRepository::ListCurrent(Transaction& t, const std::string& entity_type, const Pagination& pagination,
                                                             bool include_deleted) {
  std::string sql =
      "SELECT v.entity_type,v.entity_id,v.version,v.payload::text,v.event_type,v.actor,v.committed_at_ms,v.size_bytes,v.status"
      " FROM entity_current c JOIN entity_versions v"
      " ON v.entity_type=c.entity_type AND v.entity_id=c.entity_id AND v.version=c.version"
      " WHERE c.entity_type=$1";
  if (!include_deleted) sql += " AND c.status<>'deleted'";
  sql += " ORDER BY c.entity_id ASC LIMIT $2 OFFSET $3;";

  return ReadOrThrow([&] {
    auto res = TX(t).Work().exec_params(sql, entity_type, static_cast<int64_t>(pagination.limit), static_cast<int64_t>(pagination.offset));

    std::vector<model::SnapshotRecord> out;
    out.reserve(res.size());
    for (const auto& row : res)
      out.push_back(ReadSnapshot(row));
    return out;
  });
}

// ------------------------------------------------------------------
// Event log
// ------------------------------------------------------------------

Result PgRepository::AppendEvent(Transaction& t, const model::EventRecord& r) {
  if (TX(t).IsReadOnly()) return Result::Err(ErrorCode::Unsupported, "write in read-only transaction");
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO entity_events(") + kEventColumns +
                                 ") VALUES($1,$2,$3,$4,$5,$6::jsonb,$7::jsonb,$8,$9);",
                             r.event_id, r.entity_type, r.entity_id, r.version, r.event_type, r.delta_json, r.metadata_json, r.actor,
                             r.committed_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::EventRecord> PgRepository::ListEvents(Transaction& t, const std::string& entity_type, const std::string& entity_id,
                                                         uint64_t from_version, std::optional<uint64_t> to_version) {
  const std::string select = "SELECT event_id,entity_type,entity_id,version,event_type,delta::text,metadata::text,actor,committed_at_ms"
                             " FROM entity_events WHERE entity_type=$1 AND entity_id=$2 AND version>=$3";
  return ReadOrThrow([&] {
    auto res = to_version ? TX(t).Work().exec_params(select + " AND version<=$4 ORDER BY version ASC;", entity_type, entity_id,
                                                     from_version, *to_version)
                          : TX(t).Work().exec_params(select + " ORDER BY version ASC;", entity_type, entity_id, from_version);

    std::vector<model::EventRecord> out;
    out.reserve(res.size());
    for (const auto& row : res)
      out.push_back(ReadEvent(row));
    return out;
  });
}

std::vector<model::EventRecord> PgRepository::ListEventsByTime(Transaction& t, const std::string& entity_type, const std::string& entity_id,
                                                               uint64_t from_ms, std::optional<uint64_t> to_ms) {
  const std::string select = "SELECT event_id,entity_type,entity_id,version,event_type,delta::text,metadata::text,actor,committed_at_ms"
                             " FROM entity_events WHERE entity_type=$1 AND entity_id=$2 AND committed_at_ms>=$3";
  return ReadOrThrow([&] {
    auto res = to_ms ? TX(t).Work().exec_params(select + " AND committed_at_ms<=$4 ORDER BY version ASC;", entity_type, entity_id,
                                                from_ms, *to_ms)
                     : TX(t).Work().exec_params(select + " ORDER BY version ASC;", entity_type, entity_id, from_ms);

    std::vector<model::EventRecord> out;
    out.reserve(res.size());
    for (const auto& row : res)
      out.push_back(ReadEvent(row));
    return out;
  });
}

} // namespace statecore::db::postgres
