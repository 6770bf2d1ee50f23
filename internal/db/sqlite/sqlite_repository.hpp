#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace feedstore::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  // The schema must already exist (see EnsureSchema).
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertChannel(Transaction&, model::Channel&) override;
  Result GetChannel(Transaction&, int64_t id, std::optional<model::Channel>&) override;
  Result ListChannels(Transaction&, std::vector<model::Channel>&) override;
  Result UpdateChannel(Transaction&, const model::Channel&) override;
  Result DeleteChannel(Transaction&, int64_t id) override;

  Result InsertSource(Transaction&, model::Source&) override;
  Result GetSource(Transaction&, int64_t id, std::optional<model::Source>&) override;
  Result ListSources(Transaction&, std::optional<int64_t> channel_id, std::vector<model::Source>&) override;
  Result UpdateSource(Transaction&, const model::Source&) override;
  Result DeleteSource(Transaction&, int64_t id) override;

  Result InsertSite(Transaction&, model::Site&) override;
  Result GetSite(Transaction&, int64_t id, std::optional<model::Site>&) override;
  Result ListSites(Transaction&, std::optional<int64_t> source_id, std::vector<model::Site>&) override;
  Result UpdateSite(Transaction&, const model::Site&) override;
  Result DeleteSite(Transaction&, int64_t id) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
