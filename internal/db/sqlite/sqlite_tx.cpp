#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace feedstore::db::sqlite {

namespace {

[[noreturn]] void Rethrow(const SqliteError& e, const char* what) {
  if (e.IsBusy()) {
    throw util::LockContention(std::string(what) + ": database is locked by another writer");
  }
  throw util::StoreError(std::string(what) + ": " + e.what());
}

} // namespace

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  try {
    db_->Exec("BEGIN IMMEDIATE;");
  } catch (const SqliteError& e) {
    Rethrow(e, "begin transaction");
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const SqliteError& e) {
    FEEDSTORE_LOG_WARN("Rollback on scope exit failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (const SqliteError& e) {
    Rethrow(e, "commit");
  }
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const SqliteError& e) {
    Rethrow(e, "rollback");
  }
}

} // namespace feedstore::db::sqlite
