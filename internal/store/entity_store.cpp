#include "internal/store/entity_store.hpp"

#include <string_view>
#include <type_traits>
#include <unordered_set>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace feedstore::store {

using feedstore::db::ErrorCode;
using feedstore::observability::IntField;
using feedstore::observability::StringField;

namespace {

[[noreturn]] void ThrowDbError(const db::Result& result, std::string_view context) {
  const std::string msg = std::string(context) + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(msg, result.field, result.entity_id);
    case ErrorCode::UniqueConstraintViolation:
      throw util::UniqueConstraintViolation(msg, result.field, result.entity_id);
    case ErrorCode::ForeignKeyViolation:
      throw util::ForeignKeyViolation(msg, result.field, result.entity_id);
    case ErrorCode::InvalidEnum:
      throw util::InvalidEnum(msg, result.field, result.entity_id);
    case ErrorCode::InvalidArgument:
      throw util::InvalidArgument(msg, result.field, result.entity_id);
    case ErrorCode::Busy:
      throw util::LockContention(msg, result.field, result.entity_id);
    case ErrorCode::Corruption:
      throw util::Corruption(msg, result.field, result.entity_id);
    default:
      throw util::StoreError(msg + " (" + db::ErrorCodeName(result.code) + ")", result.field, result.entity_id);
  }
}

void ThrowIfDbError(const db::Result& result, std::string_view context) {
  if (result) {
    return;
  }
  ThrowDbError(result, context);
}

bool IsBlank(const std::string& value) {
  return value.find_first_not_of(" \t\r\n") == std::string::npos;
}

void RequireText(const std::string& value, const char* field) {
  if (IsBlank(value)) {
    throw util::InvalidArgument(std::string(field) + " is required", field);
  }
}

void ValidateChannel(const model::Channel& r) {
  RequireText(r.name, "name");
  RequireText(r.url, "url");
}

void ValidateSource(const model::Source& r) {
  RequireText(r.source_url, "source_url");
}

void ValidateSite(const model::Site& r) {
  RequireText(r.site_url, "site_url");
  if (!model::IsValidSiteType(r.site_type)) {
    throw util::InvalidEnum("site_type '" + r.site_type + "' is not one of AUTO, RENT, BUY, FREE", "site_type", r.id ? std::optional<int64_t>(r.id) : std::nullopt);
  }
}

/*
  Runs fn(tx) as one unit of work. The transaction commits only if fn
  returns normally; otherwise its destructor rolls back.
*/
template <typename Fn>
auto Transact(db::Repository& repo, std::string_view operation, Fn&& fn) {
  try {
    auto tx = repo.Begin();
    if constexpr (std::is_void_v<std::invoke_result_t<Fn, db::Transaction&>>) {
      fn(*tx);
      tx->Commit();
      return;
    } else {
      auto result = fn(*tx);
      tx->Commit();
      return result;
    }
  } catch (const util::StoreError& e) {
    FEEDSTORE_LOG_WARN("Store operation rejected", {StringField("operation", operation), StringField("field", e.field()),
                                                    IntField("id", e.entity_id().value_or(0)), StringField("error", e.what())});
    throw;
  }
}

template <typename Record>
std::vector<model::Entity> ToEntities(std::vector<Record> records) {
  std::vector<model::Entity> out;
  out.reserve(records.size());
  for (auto& record : records) {
    out.emplace_back(std::move(record));
  }
  return out;
}

} // namespace

EntityStore::EntityStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw util::StorageUnavailable("entity store requires a repository");
  }
}

EntityStore::~EntityStore() = default;

db::Repository& EntityStore::Repo() {
  if (!repository_) {
    throw util::StorageUnavailable("entity store is closed");
  }
  return *repository_;
}

void EntityStore::Close() {
  if (repository_) {
    repository_.reset();
    FEEDSTORE_LOG_DEBUG("Entity store closed");
  }
}

bool EntityStore::IsOpen() const {
  return repository_ != nullptr;
}

// ------------------------------------------------------------------
// Channels
// ------------------------------------------------------------------

std::vector<model::Channel> EntityStore::ListChannels() {
  auto& repo = Repo();
  return Transact(repo, "channels.list", [&](db::Transaction& tx) {
    std::vector<model::Channel> out;
    ThrowIfDbError(repo.ListChannels(tx, out), "list channels");
    return out;
  });
}

int64_t EntityStore::CreateChannel(const model::Channel& fields) {
  auto& repo = Repo();
  return Transact(repo, "channels.create", [&](db::Transaction& tx) {
    ValidateChannel(fields);
    model::Channel record = fields;
    record.id             = 0;
    ThrowIfDbError(repo.InsertChannel(tx, record), "create channel");
    FEEDSTORE_LOG_DEBUG("Channel created", {IntField("id", record.id), StringField("name", record.name)});
    return record.id;
  });
}

void EntityStore::UpdateChannel(int64_t id, const model::Channel& fields) {
  auto& repo = Repo();
  Transact(repo, "channels.update", [&](db::Transaction& tx) {
    model::Channel record = fields;
    record.id             = id;
    ValidateChannel(record);
    ThrowIfDbError(repo.UpdateChannel(tx, record), "update channel " + std::to_string(id));
    FEEDSTORE_LOG_DEBUG("Channel updated", {IntField("id", id)});
  });
}

void EntityStore::DeleteChannel(int64_t id) {
  auto& repo = Repo();
  Transact(repo, "channels.delete", [&](db::Transaction& tx) {
    ThrowIfDbError(repo.DeleteChannel(tx, id), "delete channel " + std::to_string(id));
    FEEDSTORE_LOG_DEBUG("Channel deleted", {IntField("id", id)});
  });
}

// ------------------------------------------------------------------
// Sources
// ------------------------------------------------------------------

std::vector<model::Source> EntityStore::ListSources() {
  auto& repo = Repo();
  return Transact(repo, "sources.list", [&](db::Transaction& tx) {
    std::vector<model::Source> out;
    ThrowIfDbError(repo.ListSources(tx, std::nullopt, out), "list sources");
    return out;
  });
}

std::vector<model::Source> EntityStore::SourcesOf(int64_t channel_id) {
  auto& repo = Repo();
  return Transact(repo, "sources.list_by_channel", [&](db::Transaction& tx) {
    std::vector<model::Source> out;
    ThrowIfDbError(repo.ListSources(tx, channel_id, out), "list sources of channel " + std::to_string(channel_id));
    return out;
  });
}

int64_t EntityStore::CreateSource(const model::Source& fields) {
  auto& repo = Repo();
  return Transact(repo, "sources.create", [&](db::Transaction& tx) {
    ValidateSource(fields);
    model::Source record = fields;
    record.id            = 0;
    ThrowIfDbError(repo.InsertSource(tx, record), "create source");
    FEEDSTORE_LOG_DEBUG("Source created", {IntField("id", record.id), IntField("channel_id", record.channel_id)});
    return record.id;
  });
}

void EntityStore::UpdateSource(int64_t id, const model::Source& fields) {
  auto& repo = Repo();
  Transact(repo, "sources.update", [&](db::Transaction& tx) {
    model::Source record = fields;
    record.id            = id;
    ValidateSource(record);
    ThrowIfDbError(repo.UpdateSource(tx, record), "update source " + std::to_string(id));
    FEEDSTORE_LOG_DEBUG("Source updated", {IntField("id", id)});
  });
}

void EntityStore::DeleteSource(int64_t id) {
  auto& repo = Repo();
  Transact(repo, "sources.delete", [&](db::Transaction& tx) {
    ThrowIfDbError(repo.DeleteSource(tx, id), "delete source " + std::to_string(id));
    FEEDSTORE_LOG_DEBUG("Source deleted", {IntField("id", id)});
  });
}

// ------------------------------------------------------------------
// Sites
// ------------------------------------------------------------------

std::vector<model::Site> EntityStore::ListSites() {
  auto& repo = Repo();
  return Transact(repo, "sites.list", [&](db::Transaction& tx) {
    std::vector<model::Site> out;
    ThrowIfDbError(repo.ListSites(tx, std::nullopt, out), "list sites");
    return out;
  });
}

std::vector<model::Site> EntityStore::SitesOf(int64_t source_id) {
  auto& repo = Repo();
  return Transact(repo, "sites.list_by_source", [&](db::Transaction& tx) {
    std::vector<model::Site> out;
    ThrowIfDbError(repo.ListSites(tx, source_id, out), "list sites of source " + std::to_string(source_id));
    return out;
  });
}

int64_t EntityStore::CreateSite(const model::Site& fields) {
  auto& repo = Repo();
  return Transact(repo, "sites.create", [&](db::Transaction& tx) {
    model::Site record = fields;
    record.id          = 0;
    ValidateSite(record);
    ThrowIfDbError(repo.InsertSite(tx, record), "create site");
    FEEDSTORE_LOG_DEBUG("Site created", {IntField("id", record.id), IntField("source_id", record.source_id)});
    return record.id;
  });
}

void EntityStore::UpdateSite(int64_t id, const model::Site& fields) {
  auto& repo = Repo();
  Transact(repo, "sites.update", [&](db::Transaction& tx) {
    model::Site record = fields;
    record.id          = id;
    ValidateSite(record);
    ThrowIfDbError(repo.UpdateSite(tx, record), "update site " + std::to_string(id));
    FEEDSTORE_LOG_DEBUG("Site updated", {IntField("id", id)});
  });
}

void EntityStore::DeleteSite(int64_t id) {
  auto& repo = Repo();
  Transact(repo, "sites.delete", [&](db::Transaction& tx) {
    ThrowIfDbError(repo.DeleteSite(tx, id), "delete site " + std::to_string(id));
    FEEDSTORE_LOG_DEBUG("Site deleted", {IntField("id", id)});
  });
}

// ------------------------------------------------------------------
// Kind dispatch
// ------------------------------------------------------------------

std::vector<model::Entity> EntityStore::List(model::EntityKind kind) {
  switch (kind) {
    case model::EntityKind::kChannel:
      return ToEntities(ListChannels());
    case model::EntityKind::kSource:
      return ToEntities(ListSources());
    case model::EntityKind::kSite:
      return ToEntities(ListSites());
  }
  throw util::InvalidArgument("unknown entity kind", "kind");
}

int64_t EntityStore::Create(const model::Entity& fields) {
  return std::visit(
      [this](const auto& record) -> int64_t {
        using T = std::decay_t<decltype(record)>;
        if constexpr (std::is_same_v<T, model::Channel>) {
          return CreateChannel(record);
        } else if constexpr (std::is_same_v<T, model::Source>) {
          return CreateSource(record);
        } else {
          return CreateSite(record);
        }
      },
      fields);
}

void EntityStore::Update(int64_t id, const model::Entity& fields) {
  std::visit(
      [this, id](const auto& record) {
        using T = std::decay_t<decltype(record)>;
        if constexpr (std::is_same_v<T, model::Channel>) {
          UpdateChannel(id, record);
        } else if constexpr (std::is_same_v<T, model::Source>) {
          UpdateSource(id, record);
        } else {
          UpdateSite(id, record);
        }
      },
      fields);
}

void EntityStore::Delete(model::EntityKind kind, int64_t id) {
  switch (kind) {
    case model::EntityKind::kChannel:
      DeleteChannel(id);
      return;
    case model::EntityKind::kSource:
      DeleteSource(id);
      return;
    case model::EntityKind::kSite:
      DeleteSite(id);
      return;
  }
  throw util::InvalidArgument("unknown entity kind", "kind");
}

// ------------------------------------------------------------------
// Word filter
// ------------------------------------------------------------------

std::vector<std::string> EntityStore::EffectiveForbiddenWords(int64_t source_id) {
  auto& repo = Repo();
  return Transact(repo, "sources.effective_forbidden_words", [&](db::Transaction& tx) {
    std::optional<model::Source> source;
    ThrowIfDbError(repo.GetSource(tx, source_id, source), "load source " + std::to_string(source_id));
    if (!source) {
      throw util::NotFound("source " + std::to_string(source_id) + " not found", "id", source_id);
    }

    std::optional<model::Channel> channel;
    ThrowIfDbError(repo.GetChannel(tx, source->channel_id, channel), "load channel " + std::to_string(source->channel_id));
    if (!channel) {
      throw util::NotFound("channel " + std::to_string(source->channel_id) + " not found", "channel_id", source->channel_id);
    }

    std::vector<std::string>        words;
    std::unordered_set<std::string> seen;
    for (const auto* list : {&channel->forbidden_words, &source->forbidden_words}) {
      for (const auto& word : *list) {
        if (seen.insert(word).second) {
          words.push_back(word);
        }
      }
    }
    return words;
  });
}

} // namespace feedstore::store
