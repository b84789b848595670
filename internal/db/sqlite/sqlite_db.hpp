#pragma once

#include <sqlite3.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace statecore::db::sqlite {

// Error raised by Exec/Prepare; carries the sqlite result code.
class SqliteError : public std::runtime_error {
 public:
  SqliteError(const std::string& msg, int rc) : std::runtime_error(msg), rc_(rc) {
  }

  int Code() const {
    return rc_;
  }

 private:
  int rc_;
};

/*
  Thin RAII wrapper around one sqlite3* connection.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, std::chrono::milliseconds busy_timeout);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout)
  void Configure(std::chrono::milliseconds busy_timeout);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  SqlitePool

  Each transaction gets its own connection so BEGIN/COMMIT of concurrent
  transactions never interleave on one handle. Same shape as PgPool.

  An in-memory database (":memory:") is private to its connection, so the
  pool is capped at one connection in that case.
*/
class SqlitePool : public std::enable_shared_from_this<SqlitePool> {
 public:
  SqlitePool(std::string path, std::chrono::milliseconds busy_timeout, std::size_t max_connections = 8);

  std::shared_ptr<SqliteDB> Acquire();

  const std::string& Path() const {
    return path_;
  }

 private:
  std::shared_ptr<SqliteDB> Wrap(SqliteDB* conn);
  void                      Release(SqliteDB* conn);

  std::string               path_;
  std::chrono::milliseconds busy_timeout_;
  std::size_t               max_connections_;

  std::mutex                             mutex_;
  std::condition_variable                cv_;
  std::vector<std::unique_ptr<SqliteDB>> idle_;
  std::size_t                            live_connections_ = 0;
};

} // namespace statecore::db::sqlite
