#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <string_view>

#include "internal/db/sql/codec.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace feedstore::db::sqlite {

using feedstore::db::ErrorCode;
using feedstore::db::Result;

namespace {

// Finalizes on scope exit so early returns cannot leak statements.
class Statement {
public:
  Statement(sqlite3* db, const char* sql) {
    rc_ = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  bool ok() const { return rc_ == SQLITE_OK && st_ != nullptr; }
  int prepare_rc() const { return rc_; }

  operator sqlite3_stmt*() const { return st_; }

private:
  sqlite3_stmt* st_ = nullptr;
  int rc_ = SQLITE_OK;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  if (!t) return {};
  return std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(st, col)));
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

// "UNIQUE constraint failed: channels.url" -> "url"
std::string ColumnFromMessage(std::string_view msg) {
  auto colon = msg.rfind(':');
  if (colon == std::string_view::npos) return {};
  auto column = msg.substr(colon + 1);
  auto dot    = column.rfind('.');
  if (dot != std::string_view::npos) column = column.substr(dot + 1);
  while (!column.empty() && column.front() == ' ') column.remove_prefix(1);
  return std::string(column);
}

Result EncodeList(const std::vector<std::string>& values, const char* field, std::string& out) {
  try {
    out = sql::EncodeStringList(values);
  } catch (const sql::CodecError& e) {
    return Result::Err(ErrorCode::InvalidArgument, e.what(), field);
  }
  return Result::Ok();
}

Result DecodeList(sqlite3_stmt* st, int col, const char* field, int64_t id, std::vector<std::string>& out) {
  try {
    out = sql::DecodeStringList(ColText(st, col));
  } catch (const sql::CodecError& e) {
    return Result::Err(ErrorCode::Corruption, e.what(), field, id);
  }
  return Result::Ok();
}

// Column order follows SELECT_CHANNEL(S).
Result ReadChannel(sqlite3_stmt* st, model::Channel& r) {
  r.id   = ColI64(st, 0);
  r.name = ColText(st, 1);
  r.url  = ColText(st, 2);
  if (auto res = DecodeList(st, 3, "post_times", r.id, r.post_times); !res) return res;
  return DecodeList(st, 4, "forbidden_words", r.id, r.forbidden_words);
}

Result ReadSource(sqlite3_stmt* st, model::Source& r) {
  r.id          = ColI64(st, 0);
  r.channel_id  = ColI64(st, 1);
  r.source_url  = ColText(st, 2);
  r.parse_media = sql::DecodeBool(ColI64(st, 3));
  return DecodeList(st, 4, "forbidden_words", r.id, r.forbidden_words);
}

Result ReadSite(sqlite3_stmt* st, model::Site& r) {
  r.id        = ColI64(st, 0);
  r.source_id = ColI64(st, 1);
  r.site_url  = ColText(st, 2);
  r.site_type = ColText(st, 3);
  return Result::Ok();
}

// Attribute a foreign key failure to the parent column the caller wrote.
Result WithParent(Result res, const char* field, int64_t parent_id) {
  if (res.code == ErrorCode::ForeignKeyViolation) {
    res.field     = field;
    res.entity_id = parent_id;
  }
  return res;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  const std::string msg = sqlite3_errmsg(db);

  switch (rc) {
    case SQLITE_CONSTRAINT_UNIQUE:
    case SQLITE_CONSTRAINT_PRIMARYKEY:
      return Result::Err(ErrorCode::UniqueConstraintViolation, msg, ColumnFromMessage(msg));
    case SQLITE_CONSTRAINT_FOREIGNKEY:
      return Result::Err(ErrorCode::ForeignKeyViolation, msg);
    case SQLITE_CONSTRAINT_CHECK:
      // the only CHECK in the schema guards sites.site_type
      return Result::Err(ErrorCode::InvalidEnum, msg, "site_type");
    case SQLITE_CONSTRAINT_NOTNULL:
      return Result::Err(ErrorCode::InvalidArgument, msg, ColumnFromMessage(msg));
    default:
      break;
  }

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, msg);
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, msg);
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, msg);
    default:
      return Result::Err(ErrorCode::InternalError, msg);
  }
}

// ------------------------------------------------------------------
// Channels
// ------------------------------------------------------------------

Result SqliteRepository::InsertChannel(Transaction& t, model::Channel& r) {
  auto* db = TX(t).Handle();

  std::string post_times;
  std::string forbidden_words;
  if (auto res = EncodeList(r.post_times, "post_times", post_times); !res) return res;
  if (auto res = EncodeList(r.forbidden_words, "forbidden_words", forbidden_words); !res) return res;

  Statement st(db, sql::INSERT_CHANNEL);
  if (!st.ok()) return Translate(db, st.prepare_rc());

  BindText(st, 1, r.name);
  BindText(st, 2, r.url);
  BindText(st, 3, post_times);
  BindText(st, 4, forbidden_words);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

Result SqliteRepository::GetChannel(Transaction& t, int64_t id, std::optional<model::Channel>& out) {
  auto* db = TX(t).Handle();
  out.reset();

  Statement st(db, sql::SELECT_CHANNEL);
  if (!st.ok()) return Translate(db, st.prepare_rc());

  BindI64(st, 1, id);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_ROW) return Translate(db, rc);

  model::Channel r;
  if (auto res = ReadChannel(st, r); !res) return res;
  out = std::move(r);
  return Result::Ok();
}

Result SqliteRepository::ListChannels(Transaction& t, std::vector<model::Channel>& out) {
  auto* db = TX(t).Handle();
  out.clear();

  Statement st(db, sql::SELECT_CHANNELS);
  if (!st.ok()) return Translate(db, st.prepare_rc());

  int rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    model::Channel r;
    if (auto res = ReadChannel(st, r); !res) return res;
    out.push_back(std::move(r));
  }
  return Translate(db, rc);
}

Result SqliteRepository::UpdateChannel(Transaction& t, const model::Channel& r) {
  auto* db = TX(t).Handle();

  std::string post_times;
  std::string forbidden_words;
  if (auto res = EncodeList(r.post_times, "post_times", post_times); !res) return res;
  if (auto res = EncodeList(r.forbidden_words, "forbidden_words", forbidden_words); !res) return res;

  Statement st(db, sql::UPDATE_CHANNEL);
  if (!st.ok()) return Translate(db, st.prepare_rc());

  BindText(st, 1, r.name);
  BindText(st, 2, r.url);
  BindText(st, 3, post_times);
  BindText(st, 4, forbidden_words);
  BindI64(st, 5, r.id);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "channel not found", "id", r.id);
  return Result::Ok();
}

Result SqliteRepository::DeleteChannel(Transaction& t, int64_t id) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::DELETE_CHANNEL);
  if (!st.ok()) return Translate(db, st.prepare_rc());

  BindI64(st, 1, id);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_DONE) return Translate(db, rc);
  // sqlite3_changes() does not count rows removed by ON DELETE CASCADE
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "channel not found", "id", id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Sources
// ------------------------------------------------------------------

Result SqliteRepository::InsertSource(Transaction& t, model::Source& r) {
  auto* db = TX(t).Handle();

  std::string forbidden_words;
  if (auto res = EncodeList(r.forbidden_words, "forbidden_words", forbidden_words); !res) return res;

  Statement st(db, sql::INSERT_SOURCE);
  if (!st.ok()) return Translate(db, st.prepare_rc());

  BindI64(st, 1, r.channel_id);
  BindText(st, 2, r.source_url);
  sqlite3_bind_int(st, 3, sql::EncodeBool(r.parse_media));
  BindText(st, 4, forbidden_words);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_DONE) return WithParent(Translate(db, rc), "channel_id", r.channel_id);

  r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

Result SqliteRepository::GetSource(Transaction& t, int64_t id, std::optional<model::Source>& out) {
  auto* db = TX(t).Handle();
  out.reset();

  Statement st(db, sql::SELECT_SOURCE);
  if (!st.ok()) return Translate(db, st.prepare_rc());

  BindI64(st, 1, id);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_ROW) return Translate(db, rc);

  model::Source r;
  if (auto res = ReadSource(st, r); !res) return res;
  out = std::move(r);
  return Result::Ok();
}

Result SqliteRepository::ListSources(Transaction& t, std::optional<int64_t> channel_id, std::vector<model::Source>& out) {
  auto* db = TX(t).Handle();
  out.clear();

  Statement st(db, channel_id ? sql::SELECT_SOURCES_BY_CHANNEL : sql::SELECT_SOURCES);
  if (!st.ok()) return Translate(db, st.prepare_rc());

  if (channel_id) BindI64(st, 1, *channel_id);

  int rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    model::Source r;
    if (auto res = ReadSource(st, r); !res) return res;
    out.push_back(std::move(r));
  }
  return Translate(db, rc);
}

Result SqliteRepository::UpdateSource(Transaction& t, const model::Source& r) {
  auto* db = TX(t).Handle();

  std::string forbidden_words;
  if (auto res = EncodeList(r.forbidden_words, "forbidden_words", forbidden_words); !res) return res;

  Statement st(db, sql::UPDATE_SOURCE);
  if (!st.ok()) return Translate(db, st.prepare_rc());

  BindI64(st, 1, r.channel_id);
  BindText(st, 2, r.source_url);
  sqlite3_bind_int(st, 3, sql::EncodeBool(r.parse_media));
  BindText(st, 4, forbidden_words);
  BindI64(st, 5, r.id);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_DONE) return WithParent(Translate(db, rc), "channel_id", r.channel_id);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "source not found", "id", r.id);
  return Result::Ok();
}

Result SqliteRepository::DeleteSource(Transaction& t, int64_t id) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::DELETE_SOURCE);
  if (!st.ok()) return Translate(db, st.prepare_rc());

  BindI64(st, 1, id);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "source not found", "id", id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Sites
// ------------------------------------------------------------------

Result SqliteRepository::InsertSite(Transaction& t, model::Site& r) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::INSERT_SITE);
  if (!st.ok()) return Translate(db, st.prepare_rc());

  BindI64(st, 1, r.source_id);
  BindText(st, 2, r.site_url);
  BindText(st, 3, r.site_type);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_DONE) return WithParent(Translate(db, rc), "source_id", r.source_id);

  r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

Result SqliteRepository::GetSite(Transaction& t, int64_t id, std::optional<model::Site>& out) {
  auto* db = TX(t).Handle();
  out.reset();

  Statement st(db, sql::SELECT_SITE);
  if (!st.ok()) return Translate(db, st.prepare_rc());

  BindI64(st, 1, id);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_ROW) return Translate(db, rc);

  model::Site r;
  if (auto res = ReadSite(st, r); !res) return res;
  out = std::move(r);
  return Result::Ok();
}

Result SqliteRepository::ListSites(Transaction& t, std::optional<int64_t> source_id, std::vector<model::Site>& out) {
  auto* db = TX(t).Handle();
  out.clear();

  Statement st(db, source_id ? sql::SELECT_SITES_BY_SOURCE : sql::SELECT_SITES);
  if (!st.ok()) return Translate(db, st.prepare_rc());

  if (source_id) BindI64(st, 1, *source_id);

  int rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    model::Site r;
    if (auto res = ReadSite(st, r); !res) return res;
    out.push_back(std::move(r));
  }
  return Translate(db, rc);
}

Result SqliteRepository::UpdateSite(Transaction& t, const model::Site& r) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::UPDATE_SITE);
  if (!st.ok()) return Translate(db, st.prepare_rc());

  BindI64(st, 1, r.source_id);
  BindText(st, 2, r.site_url);
  BindText(st, 3, r.site_type);
  BindI64(st, 4, r.id);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_DONE) return WithParent(Translate(db, rc), "source_id", r.source_id);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "site not found", "id", r.id);
  return Result::Ok();
}

Result SqliteRepository::DeleteSite(Transaction& t, int64_t id) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::DELETE_SITE);
  if (!st.ok()) return Translate(db, st.prepare_rc());

  BindI64(st, 1, id);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "site not found", "id", id);
  return Result::Ok();
}

} // namespace feedstore::db::sqlite
