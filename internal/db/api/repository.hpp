#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/channel.hpp"
#include "internal/model/site.hpp"
#include "internal/model/source.hpp"

namespace feedstore::db {

/*
  Repository abstraction over the channel -> source -> site graph.

  CRITICAL GUARANTEES (every backend):

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its own writes
  - channels.name and channels.url are unique
  - A source's channel and a site's source must exist
  - Deleting a row removes its descendants in the same transaction
  - site_type outside {AUTO,RENT,BUY,FREE} is rejected
  - Ids are assigned on insert, ascending, never reused

  Update/Delete of a missing id report ErrorCode::NotFound.
  List results are ordered by id.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Channels
  // ---------------------------------------------------------------------

  // On success channel.id holds the generated id.
  virtual Result InsertChannel(Transaction&, model::Channel& channel) = 0;

  virtual Result GetChannel(Transaction&, int64_t id, std::optional<model::Channel>& out) = 0;

  virtual Result ListChannels(Transaction&, std::vector<model::Channel>& out) = 0;

  virtual Result UpdateChannel(Transaction&, const model::Channel& channel) = 0;

  virtual Result DeleteChannel(Transaction&, int64_t id) = 0;

  // ---------------------------------------------------------------------
  // Sources
  // ---------------------------------------------------------------------

  virtual Result InsertSource(Transaction&, model::Source& source) = 0;

  virtual Result GetSource(Transaction&, int64_t id, std::optional<model::Source>& out) = 0;

  // channel_id restricts the listing to one channel's sources
  virtual Result ListSources(Transaction&, std::optional<int64_t> channel_id, std::vector<model::Source>& out) = 0;

  virtual Result UpdateSource(Transaction&, const model::Source& source) = 0;

  virtual Result DeleteSource(Transaction&, int64_t id) = 0;

  // ---------------------------------------------------------------------
  // Sites
  // ---------------------------------------------------------------------

  virtual Result InsertSite(Transaction&, model::Site& site) = 0;

  virtual Result GetSite(Transaction&, int64_t id, std::optional<model::Site>& out) = 0;

  virtual Result ListSites(Transaction&, std::optional<int64_t> source_id, std::vector<model::Site>& out) = 0;

  virtual Result UpdateSite(Transaction&, const model::Site& site) = 0;

  virtual Result DeleteSite(Transaction&, int64_t id) = 0;
};

} // namespace feedstore::db
