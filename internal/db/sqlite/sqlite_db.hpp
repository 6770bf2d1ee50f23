#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace feedstore::db::sqlite {

struct SqliteOptions {
  // how long a statement waits on another writer's lock before SQLITE_BUSY
  int  busy_timeout_ms = 5000;
  bool wal_mode        = false;
};

/*
  Thin RAII wrapper around sqlite3*.

  Construction opens (or creates) the file and configures the connection.
  foreign_keys is switched on here for every connection: SQLite defaults it
  to OFF, which would silently disable ON DELETE CASCADE.

  Throws util::StorageUnavailable if the file cannot be opened, is not a
  database, or the engine refuses foreign key enforcement. The handle is
  closed before the exception leaves the constructor.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (pragmas, DDL, transaction control).
  // Throws SqliteError carrying the extended result code.
  void Exec(const std::string& sql);

  // First column of the first row as an integer (0 when no row).
  int64_t QueryInt(const std::string& sql);

 private:
  void Configure();

  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
};

class SqliteError : public std::runtime_error {
 public:
  SqliteError(int code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  // extended result code
  int code() const {
    return code_;
  }

  bool IsBusy() const {
    return (code_ & 0xff) == SQLITE_BUSY || (code_ & 0xff) == SQLITE_LOCKED;
  }

 private:
  int code_;
};

} // namespace feedstore::db::sqlite
