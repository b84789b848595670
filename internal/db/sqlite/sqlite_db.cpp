#include "sqlite_db.hpp"

#include <stdexcept>

namespace statecore::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw SqliteError(std::string(what) + ": " + sqlite3_errmsg(db), rc);
  }
}

SqliteDB::SqliteDB(std::string path, std::chrono::milliseconds busy_timeout) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw SqliteError(msg, rc);
  }

  try {
    Configure(busy_timeout);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw SqliteError(msg, rc);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure(std::chrono::milliseconds busy_timeout) {
  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");

  // writers wait up to the commit timeout, then fail with SQLITE_BUSY
  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count())), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

// ------------------------------------------------------------------
// Pool
// ------------------------------------------------------------------

SqlitePool::SqlitePool(std::string path, std::chrono::milliseconds busy_timeout, std::size_t max_connections)
    : path_(std::move(path)), busy_timeout_(busy_timeout), max_connections_(max_connections == 0 ? 1 : max_connections) {
  if (path_ == ":memory:") max_connections_ = 1;
}

std::shared_ptr<SqliteDB> SqlitePool::Acquire() {
  std::unique_lock lock(mutex_);
  for (;;) {
    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        return Wrap(new SqliteDB(path_, busy_timeout_));
      } catch (...) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
  }
}

std::shared_ptr<SqliteDB> SqlitePool::Wrap(SqliteDB* conn) {
  std::weak_ptr<SqlitePool> weak_self = shared_from_this();
  return std::shared_ptr<SqliteDB>(conn, [weak_self](SqliteDB* released) {
    if (auto self = weak_self.lock()) {
      self->Release(released);
      return;
    }
    delete released;
  });
}

void SqlitePool::Release(SqliteDB* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace statecore::db::sqlite
