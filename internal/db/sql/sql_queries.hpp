#pragma once

namespace feedstore::db::sql {

/*
  Canonical SQL for the channel/source/site tables.

  Every value is a bound '?' parameter; nothing is ever spliced into the
  text. Listings are ordered by id, which is insertion order under
  AUTOINCREMENT.
*/

// channels

static constexpr const char* INSERT_CHANNEL =
    "INSERT INTO channels(name,url,post_times,forbidden_words)"
    " VALUES(?,?,?,?);";

static constexpr const char* SELECT_CHANNEL =
    "SELECT id,name,url,post_times,forbidden_words"
    " FROM channels WHERE id=?;";

static constexpr const char* SELECT_CHANNELS =
    "SELECT id,name,url,post_times,forbidden_words"
    " FROM channels ORDER BY id;";

static constexpr const char* UPDATE_CHANNEL =
    "UPDATE channels SET name=?,url=?,post_times=?,forbidden_words=?"
    " WHERE id=?;";

static constexpr const char* DELETE_CHANNEL =
    "DELETE FROM channels WHERE id=?;";

// sources

static constexpr const char* INSERT_SOURCE =
    "INSERT INTO sources(channel_id,source_url,parse_media,forbidden_words)"
    " VALUES(?,?,?,?);";

static constexpr const char* SELECT_SOURCE =
    "SELECT id,channel_id,source_url,parse_media,forbidden_words"
    " FROM sources WHERE id=?;";

static constexpr const char* SELECT_SOURCES =
    "SELECT id,channel_id,source_url,parse_media,forbidden_words"
    " FROM sources ORDER BY id;";

static constexpr const char* SELECT_SOURCES_BY_CHANNEL =
    "SELECT id,channel_id,source_url,parse_media,forbidden_words"
    " FROM sources WHERE channel_id=? ORDER BY id;";

static constexpr const char* UPDATE_SOURCE =
    "UPDATE sources SET channel_id=?,source_url=?,parse_media=?,forbidden_words=?"
    " WHERE id=?;";

static constexpr const char* DELETE_SOURCE =
    "DELETE FROM sources WHERE id=?;";

// sites

static constexpr const char* INSERT_SITE =
    "INSERT INTO sites(source_id,site_url,site_type)"
    " VALUES(?,?,?);";

static constexpr const char* SELECT_SITE =
    "SELECT id,source_id,site_url,site_type"
    " FROM sites WHERE id=?;";

static constexpr const char* SELECT_SITES =
    "SELECT id,source_id,site_url,site_type"
    " FROM sites ORDER BY id;";

static constexpr const char* SELECT_SITES_BY_SOURCE =
    "SELECT id,source_id,site_url,site_type"
    " FROM sites WHERE source_id=? ORDER BY id;";

static constexpr const char* UPDATE_SITE =
    "UPDATE sites SET source_id=?,site_url=?,site_type=?"
    " WHERE id=?;";

static constexpr const char* DELETE_SITE =
    "DELETE FROM sites WHERE id=?;";

}
