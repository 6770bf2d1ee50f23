#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/util/errors.hpp"

namespace {

using feedstore::db::sqlite::EnsureSchema;
using feedstore::db::sqlite::SqliteDB;
using feedstore::db::sqlite::SqliteError;

std::string TempDbPath(const std::string& test_name) {
  const auto base_dir = std::filesystem::temp_directory_path() / "feedstore_schema_tests";
  std::filesystem::create_directories(base_dir);

  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto path  = base_dir / (test_name + "_" + std::to_string(stamp) + ".db");
  std::filesystem::remove(path);
  return path.string();
}

void TestEnsureSchemaIsIdempotentAndKeepsRows() {
  const auto path = TempDbPath("idempotent");
  {
    SqliteDB db(path);
    EnsureSchema(db);
    db.Exec("INSERT INTO channels(name,url,post_times,forbidden_words) VALUES('news','https://x','[]','[]');");
  }
  {
    SqliteDB db(path);
    EnsureSchema(db);
    EnsureSchema(db);
    assert(db.QueryInt("SELECT COUNT(*) FROM channels;") == 1);
  }
  std::filesystem::remove(path);
}

void TestForeignKeysAreOnForEveryConnection() {
  const auto path = TempDbPath("foreign_keys");
  SqliteDB   db(path);
  assert(db.QueryInt("PRAGMA foreign_keys;") == 1);
  std::filesystem::remove(path);
}

void TestWalModeIsApplied() {
  const auto path = TempDbPath("wal");
  {
    SqliteDB db(path, {.busy_timeout_ms = 100, .wal_mode = true});
    EnsureSchema(db);
    assert(db.QueryInt("SELECT COUNT(*) FROM pragma_journal_mode WHERE journal_mode = 'wal';") == 1);
  }
  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");
}

void TestCheckConstraintRejectsUnknownSiteType() {
  const auto path = TempDbPath("check");
  SqliteDB   db(path);
  EnsureSchema(db);

  db.Exec("INSERT INTO channels(name,url) VALUES('c','https://c');");
  db.Exec("INSERT INTO sources(channel_id,source_url,parse_media) VALUES(1,'https://s',0);");

  bool threw = false;
  try {
    db.Exec("INSERT INTO sites(source_id,site_url,site_type) VALUES(1,'https://t','LEASE');");
  } catch (const SqliteError& e) {
    threw = (e.code() == SQLITE_CONSTRAINT_CHECK);
  }
  assert(threw && "raw inserts must hit the site_type CHECK constraint.");
  assert(db.QueryInt("SELECT COUNT(*) FROM sites;") == 0);
  std::filesystem::remove(path);
}

void TestCascadeIsWiredInStorage() {
  const auto path = TempDbPath("cascade");
  SqliteDB   db(path);
  EnsureSchema(db);

  db.Exec("INSERT INTO channels(name,url) VALUES('c','https://c');");
  db.Exec("INSERT INTO sources(channel_id,source_url,parse_media) VALUES(1,'https://s',1);");
  db.Exec("INSERT INTO sites(source_id,site_url,site_type) VALUES(1,'https://t','RENT');");

  db.Exec("DELETE FROM channels WHERE id = 1;");
  assert(db.QueryInt("SELECT COUNT(*) FROM sources;") == 0);
  assert(db.QueryInt("SELECT COUNT(*) FROM sites;") == 0);
  std::filesystem::remove(path);
}

void TestLegacySitesShapeFailsStartup() {
  const auto path = TempDbPath("legacy");
  {
    SqliteDB db(path);
    db.Exec("CREATE TABLE sites (id INTEGER PRIMARY KEY AUTOINCREMENT, channel_id INTEGER NOT NULL, site_url TEXT NOT NULL, site_type TEXT NOT NULL);");
  }

  bool threw = false;
  try {
    SqliteDB db(path);
    EnsureSchema(db);
  } catch (const feedstore::util::StorageUnavailable&) {
    threw = true;
  }
  assert(threw && "a legacy sites.channel_id table must abort startup.");

  // failed bootstrap leaves nothing behind
  SqliteDB db(path);
  assert(db.QueryInt("SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name = 'channels';") == 0);
  std::filesystem::remove(path);
}

void TestUnopenablePathIsStorageUnavailable() {
  bool threw = false;
  try {
    SqliteDB db("/nonexistent-feedstore-dir/sub/channels.db");
  } catch (const feedstore::util::StorageUnavailable&) {
    threw = true;
  }
  assert(threw);
}

void TestNonDatabaseFileIsStorageUnavailable() {
  const auto path = TempDbPath("not_a_db");
  {
    std::ofstream out(path);
    for (int i = 0; i < 64; ++i) {
      out << "this is definitely not an sqlite database file\n";
    }
  }

  bool threw = false;
  try {
    SqliteDB db(path);
    EnsureSchema(db);
  } catch (const feedstore::util::StorageUnavailable&) {
    threw = true;
  }
  assert(threw);
  std::filesystem::remove(path);
}

} // namespace

int main() {
  TestEnsureSchemaIsIdempotentAndKeepsRows();
  TestForeignKeysAreOnForEveryConnection();
  TestWalModeIsApplied();
  TestCheckConstraintRejectsUnknownSiteType();
  TestCascadeIsWiredInStorage();
  TestLegacySitesShapeFailsStartup();
  TestUnopenablePathIsStorageUnavailable();
  TestNonDatabaseFileIsStorageUnavailable();

  std::cout << "feedstore_unit_sqlite_schema: pass\n";
  return 0;
}
