#include "sqlite_schema.hpp"

#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace feedstore::db::sqlite {

using feedstore::observability::StringField;

void EnsureSchema(SqliteDB& db) {
  try {
    db.Exec("BEGIN IMMEDIATE;");
  } catch (const SqliteError& e) {
    throw util::StorageUnavailable("schema bootstrap on '" + db.Path() + "' could not start: " + e.what());
  }

  try {
    for (const char* statement : sql::kSchemaStatements) {
      db.Exec(statement);
    }
    for (const char* probe : sql::kSchemaProbes) {
      db.Exec(probe);
    }
    db.Exec("COMMIT;");
  } catch (const SqliteError& e) {
    try {
      db.Exec("ROLLBACK;");
    } catch (const SqliteError& rollback_error) {
      FEEDSTORE_LOG_WARN("Schema rollback failed", {StringField("error", rollback_error.what())});
    }
    FEEDSTORE_LOG_ERROR("Schema bootstrap failed", {StringField("path", db.Path()), StringField("error", e.what())});
    throw util::StorageUnavailable("schema bootstrap on '" + db.Path() + "' failed: " + e.what());
  }

  FEEDSTORE_LOG_INFO("Schema ready", {StringField("path", db.Path())});
}

} // namespace feedstore::db::sqlite
