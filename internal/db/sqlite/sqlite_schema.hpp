#pragma once

#include "sqlite_db.hpp"

namespace feedstore::db::sqlite {

/*
  Idempotent bootstrap of the channels/sources/sites tables.

  Safe on every startup: creates what is missing, keeps existing rows, then
  probes the expected columns of each table. Any failure is reported as
  util::StorageUnavailable and nothing from the failed bootstrap is kept.
*/
void EnsureSchema(SqliteDB& db);

} // namespace feedstore::db::sqlite
