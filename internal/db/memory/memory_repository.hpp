#pragma once

#include <cstdint>
#include <map>
#include <mutex>

#include "internal/db/api/repository.hpp"

namespace feedstore::db::memory {

class MemoryTransaction;

/*
  In-process backend with the same contract as the sqlite one.

  Constraints the sqlite schema declares (UNIQUE, FOREIGN KEY, CHECK,
  ON DELETE CASCADE, AUTOINCREMENT) are enforced here by hand.
  Nothing survives the process.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    // ordered by id, which is insertion order
    std::map<int64_t, model::Channel> channels;
    std::map<int64_t, model::Source>  sources;
    std::map<int64_t, model::Site>    sites;

    int64_t next_channel_id = 1;
    int64_t next_source_id  = 1;
    int64_t next_site_id    = 1;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
