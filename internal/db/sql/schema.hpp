#pragma once

#include <array>

namespace feedstore::db::sql {

/*
  Table definitions. Applied with IF NOT EXISTS on every startup, so they
  must stay additive: never DROP, never ALTER.

  ON DELETE CASCADE only fires while PRAGMA foreign_keys is ON for the
  connection; SqliteDB turns it on at open.
*/

static constexpr std::array<const char*, 3> kSchemaStatements = {
    "CREATE TABLE IF NOT EXISTS channels ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " name TEXT UNIQUE NOT NULL,"
    " url TEXT UNIQUE NOT NULL,"
    " post_times TEXT,"
    " forbidden_words TEXT);",

    "CREATE TABLE IF NOT EXISTS sources ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " channel_id INTEGER NOT NULL,"
    " source_url TEXT NOT NULL,"
    " parse_media INTEGER NOT NULL,"
    " forbidden_words TEXT,"
    " FOREIGN KEY(channel_id) REFERENCES channels(id) ON DELETE CASCADE);",

    "CREATE TABLE IF NOT EXISTS sites ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " source_id INTEGER NOT NULL,"
    " site_url TEXT NOT NULL,"
    " site_type TEXT CHECK(site_type IN ('AUTO','RENT','BUY','FREE')) NOT NULL,"
    " FOREIGN KEY(source_id) REFERENCES sources(id) ON DELETE CASCADE);",
};

// Column probes run after bootstrap. A table left behind by other tooling
// with a different shape fails here instead of on first use.
static constexpr std::array<const char*, 3> kSchemaProbes = {
    "SELECT id,name,url,post_times,forbidden_words FROM channels LIMIT 1;",
    "SELECT id,channel_id,source_url,parse_media,forbidden_words FROM sources LIMIT 1;",
    "SELECT id,source_id,site_url,site_type FROM sites LIMIT 1;",
};

}
