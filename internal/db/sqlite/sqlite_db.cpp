#include "sqlite_db.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace feedstore::db::sqlite {

using feedstore::observability::IntField;
using feedstore::observability::StringField;

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw SqliteError(sqlite3_extended_errcode(db), std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)), options_(options) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    FEEDSTORE_LOG_ERROR("Cannot open database", {StringField("path", path_), StringField("error", msg)});
    throw util::StorageUnavailable("cannot open database '" + path_ + "': " + msg);
  }

  try {
    Configure();
  } catch (const std::exception& e) {
    sqlite3_close(db_);
    db_ = nullptr;
    FEEDSTORE_LOG_ERROR("Cannot configure database", {StringField("path", path_), StringField("error", e.what())});
    throw util::StorageUnavailable("cannot configure database '" + path_ + "': " + e.what());
  }

  FEEDSTORE_LOG_DEBUG("Database opened", {StringField("path", path_), IntField("busy_timeout_ms", options_.busy_timeout_ms)});
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
    throw SqliteError(sqlite3_extended_errcode(db_), msg);
  }
}

int64_t SqliteDB::QueryInt(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  ThrowIf(sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr), db_, "sqlite prepare");

  int64_t value = 0;
  int     rc    = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    value = sqlite3_column_int64(stmt, 0);
  } else if (rc != SQLITE_DONE) {
    int code = sqlite3_extended_errcode(db_);
    std::string msg = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    throw SqliteError(code, "sqlite step: " + msg);
  }
  sqlite3_finalize(stmt);
  return value;
}

void SqliteDB::Configure() {
  // constraint failures report SQLITE_CONSTRAINT_UNIQUE / _FOREIGNKEY / _CHECK
  ThrowIf(sqlite3_extended_result_codes(db_, 1), db_, "extended_result_codes");

  // first statement to touch the file; "file is not a database" surfaces here
  Exec(options_.wal_mode ? "PRAGMA journal_mode=WAL;" : "PRAGMA journal_mode=DELETE;");

  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite, and the setting is per connection
  Exec("PRAGMA foreign_keys=ON;");
  if (QueryInt("PRAGMA foreign_keys;") != 1) {
    throw std::runtime_error("foreign key enforcement is unavailable in this sqlite build");
  }

  ThrowIf(sqlite3_busy_timeout(db_, options_.busy_timeout_ms), db_, "busy_timeout");
}

} // namespace feedstore::db::sqlite
