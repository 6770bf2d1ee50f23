#include "memory_repository.hpp"

#include "internal/db/sql/codec.hpp"
#include "internal/model/site_type.hpp"
#include "memory_tx.hpp"

namespace feedstore::db::memory {

namespace {

Result Missing(const char* what, int64_t id) {
  return Result::Err(ErrorCode::NotFound, std::string(what) + " not found", "id", id);
}

Result MissingParent(const char* field, int64_t parent_id) {
  return Result::Err(ErrorCode::ForeignKeyViolation, "FOREIGN KEY constraint failed", field, parent_id);
}

// UNIQUE(name), UNIQUE(url) against every channel except `self`.
template <typename Channels>
Result CheckChannelUnique(const Channels& channels, const model::Channel& r, int64_t self) {
  for (const auto& [id, existing] : channels) {
    if (id == self) continue;
    if (existing.name == r.name) {
      return Result::Err(ErrorCode::UniqueConstraintViolation, "UNIQUE constraint failed: channels.name", "name");
    }
    if (existing.url == r.url) {
      return Result::Err(ErrorCode::UniqueConstraintViolation, "UNIQUE constraint failed: channels.url", "url");
    }
  }
  return Result::Ok();
}

Result CheckSiteType(const std::string& site_type) {
  if (!model::IsValidSiteType(site_type)) {
    return Result::Err(ErrorCode::InvalidEnum, "CHECK constraint failed: site_type", "site_type");
  }
  return Result::Ok();
}

// Same rule the sqlite backend applies when encoding the JSON column.
Result CheckList(const std::vector<std::string>& values, const char* field) {
  for (const auto& value : values) {
    if (!sql::IsValidUtf8(value)) {
      return Result::Err(ErrorCode::InvalidArgument, std::string(field) + ": list element is not valid UTF-8", field);
    }
  }
  return Result::Ok();
}

template <typename Map, typename Pred>
void EraseIf(Map& map, Pred pred) {
  for (auto it = map.begin(); it != map.end();) {
    if (pred(it->second)) {
      it = map.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Channels
// ------------------------------------------------------------------

Result MemoryRepository::InsertChannel(Transaction& t, model::Channel& r) {
  auto& s = TX(t).Mutable();
  if (auto res = CheckList(r.post_times, "post_times"); !res) return res;
  if (auto res = CheckList(r.forbidden_words, "forbidden_words"); !res) return res;
  if (auto res = CheckChannelUnique(s.channels, r, 0); !res) return res;

  r.id             = s.next_channel_id++;
  s.channels[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::GetChannel(Transaction& t, int64_t id, std::optional<model::Channel>& out) {
  const auto& s  = TX(t).View();
  auto        it = s.channels.find(id);
  if (it == s.channels.end()) {
    out.reset();
  } else {
    out = it->second;
  }
  return Result::Ok();
}

Result MemoryRepository::ListChannels(Transaction& t, std::vector<model::Channel>& out) {
  const auto& s = TX(t).View();
  out.clear();
  out.reserve(s.channels.size());
  for (const auto& [_, record] : s.channels) {
    out.push_back(record);
  }
  return Result::Ok();
}

Result MemoryRepository::UpdateChannel(Transaction& t, const model::Channel& r) {
  auto& s = TX(t).Mutable();
  if (auto res = CheckList(r.post_times, "post_times"); !res) return res;
  if (auto res = CheckList(r.forbidden_words, "forbidden_words"); !res) return res;
  if (!s.channels.contains(r.id)) return Missing("channel", r.id);
  if (auto res = CheckChannelUnique(s.channels, r, r.id); !res) return res;

  s.channels[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteChannel(Transaction& t, int64_t id) {
  auto& s = TX(t).Mutable();
  if (!s.channels.contains(id)) return Missing("channel", id);

  // ON DELETE CASCADE: channel -> sources -> sites
  for (const auto& [source_id, source] : s.sources) {
    if (source.channel_id == id) {
      EraseIf(s.sites, [sid = source_id](const model::Site& site) { return site.source_id == sid; });
    }
  }
  EraseIf(s.sources, [id](const model::Source& source) { return source.channel_id == id; });
  s.channels.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Sources
// ------------------------------------------------------------------

Result MemoryRepository::InsertSource(Transaction& t, model::Source& r) {
  auto& s = TX(t).Mutable();
  if (auto res = CheckList(r.forbidden_words, "forbidden_words"); !res) return res;
  if (!s.channels.contains(r.channel_id)) return MissingParent("channel_id", r.channel_id);

  r.id            = s.next_source_id++;
  s.sources[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::GetSource(Transaction& t, int64_t id, std::optional<model::Source>& out) {
  const auto& s  = TX(t).View();
  auto        it = s.sources.find(id);
  if (it == s.sources.end()) {
    out.reset();
  } else {
    out = it->second;
  }
  return Result::Ok();
}

Result MemoryRepository::ListSources(Transaction& t, std::optional<int64_t> channel_id, std::vector<model::Source>& out) {
  const auto& s = TX(t).View();
  out.clear();
  for (const auto& [_, record] : s.sources) {
    if (channel_id && record.channel_id != *channel_id) continue;
    out.push_back(record);
  }
  return Result::Ok();
}

Result MemoryRepository::UpdateSource(Transaction& t, const model::Source& r) {
  auto& s = TX(t).Mutable();
  if (auto res = CheckList(r.forbidden_words, "forbidden_words"); !res) return res;
  if (!s.sources.contains(r.id)) return Missing("source", r.id);
  if (!s.channels.contains(r.channel_id)) return MissingParent("channel_id", r.channel_id);

  s.sources[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteSource(Transaction& t, int64_t id) {
  auto& s = TX(t).Mutable();
  if (!s.sources.contains(id)) return Missing("source", id);

  EraseIf(s.sites, [id](const model::Site& site) { return site.source_id == id; });
  s.sources.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Sites
// ------------------------------------------------------------------

Result MemoryRepository::InsertSite(Transaction& t, model::Site& r) {
  auto& s = TX(t).Mutable();
  if (auto res = CheckSiteType(r.site_type); !res) return res;
  if (!s.sources.contains(r.source_id)) return MissingParent("source_id", r.source_id);

  r.id          = s.next_site_id++;
  s.sites[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::GetSite(Transaction& t, int64_t id, std::optional<model::Site>& out) {
  const auto& s  = TX(t).View();
  auto        it = s.sites.find(id);
  if (it == s.sites.end()) {
    out.reset();
  } else {
    out = it->second;
  }
  return Result::Ok();
}

Result MemoryRepository::ListSites(Transaction& t, std::optional<int64_t> source_id, std::vector<model::Site>& out) {
  const auto& s = TX(t).View();
  out.clear();
  for (const auto& [_, record] : s.sites) {
    if (source_id && record.source_id != *source_id) continue;
    out.push_back(record);
  }
  return Result::Ok();
}

Result MemoryRepository::UpdateSite(Transaction& t, const model::Site& r) {
  auto& s = TX(t).Mutable();
  if (!s.sites.contains(r.id)) return Missing("site", r.id);
  if (auto res = CheckSiteType(r.site_type); !res) return res;
  if (!s.sources.contains(r.source_id)) return MissingParent("source_id", r.source_id);

  s.sites[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteSite(Transaction& t, int64_t id) {
  auto& s = TX(t).Mutable();
  if (!s.sites.contains(id)) return Missing("site", id);

  s.sites.erase(id);
  return Result::Ok();
}

} // namespace feedstore::db::memory
