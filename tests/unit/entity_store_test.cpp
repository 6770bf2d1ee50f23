#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/model/entity.hpp"
#include "internal/store/entity_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using feedstore::model::Channel;
using feedstore::model::EntityKind;
using feedstore::model::Site;
using feedstore::model::Source;
using feedstore::store::EntityStore;

struct Backend {
  std::string                                   name;
  std::function<std::unique_ptr<EntityStore>()> open;
  std::function<void()>                         cleanup;
};

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

Channel MakeChannel(const std::string& name, const std::string& url) {
  Channel c;
  c.name            = name;
  c.url             = url;
  c.post_times      = {"09:00", "18:00"};
  c.forbidden_words = {"spam"};
  return c;
}

Source MakeSource(int64_t channel_id, const std::string& url, bool parse_media = false) {
  Source s;
  s.channel_id  = channel_id;
  s.source_url  = url;
  s.parse_media = parse_media;
  return s;
}

Site MakeSite(int64_t source_id, const std::string& url, const std::string& type = "AUTO") {
  Site s;
  s.source_id = source_id;
  s.site_url  = url;
  s.site_type = type;
  return s;
}

void TestEndToEndChannelLifecycle(EntityStore& store) {
  const auto id = store.CreateChannel(MakeChannel("news", "https://x"));
  assert(id > 0);

  const auto channels = store.ListChannels();
  assert(channels.size() == 1);
  assert(channels[0].id == id);
  assert(channels[0].name == "news");
  assert(channels[0].url == "https://x");
  assert((channels[0].post_times == std::vector<std::string>{"09:00", "18:00"}));
  assert((channels[0].forbidden_words == std::vector<std::string>{"spam"}));

  store.DeleteChannel(id);
  assert(store.ListChannels().empty());
}

void TestCascadeDelete(EntityStore& store) {
  const auto c = store.CreateChannel(MakeChannel("cascade", "https://cascade"));
  const auto s = store.CreateSource(MakeSource(c, "https://source", true));
  const auto t = store.CreateSite(MakeSite(s, "https://site", "RENT"));

  const auto other_c = store.CreateChannel(MakeChannel("keep", "https://keep"));
  const auto other_s = store.CreateSource(MakeSource(other_c, "https://keep/source"));
  store.CreateSite(MakeSite(other_s, "https://keep/site"));

  store.DeleteChannel(c);

  for (const auto& source : store.ListSources()) assert(source.id != s);
  for (const auto& site : store.ListSites()) assert(site.id != t);
  assert(store.ListSources().size() == 1);
  assert(store.ListSites().size() == 1);

  // deleting a source takes its sites with it
  store.DeleteSource(other_s);
  assert(store.ListSites().empty());
  store.DeleteChannel(other_c);
}

void TestUniqueUrl(EntityStore& store) {
  const auto first = store.CreateChannel(MakeChannel("first", "https://dup"));

  bool threw = false;
  try {
    store.CreateChannel(MakeChannel("second", "https://dup"));
  } catch (const feedstore::util::UniqueConstraintViolation& e) {
    threw = true;
    assert(e.field() == "url");
  }
  assert(threw);

  const auto channels = store.ListChannels();
  assert(channels.size() == 1);
  assert(channels[0].id == first);
  assert(channels[0].name == "first");

  // renaming onto a taken name is rejected too
  const auto second = store.CreateChannel(MakeChannel("second", "https://other"));
  assert(Throws<feedstore::util::UniqueConstraintViolation>([&] { store.UpdateChannel(second, MakeChannel("first", "https://other")); }));

  // replacing a record with its own values is not a conflict
  store.UpdateChannel(first, MakeChannel("first", "https://dup"));

  store.DeleteChannel(first);
  store.DeleteChannel(second);
}

void TestForeignKeys(EntityStore& store) {
  bool threw = false;
  try {
    store.CreateSource(MakeSource(4242, "https://orphan"));
  } catch (const feedstore::util::ForeignKeyViolation& e) {
    threw = true;
    assert(e.field() == "channel_id");
  }
  assert(threw);
  assert(store.ListSources().empty());

  assert(Throws<feedstore::util::ForeignKeyViolation>([&] { store.CreateSite(MakeSite(4242, "https://orphan")); }));
  assert(store.ListSites().empty());

  const auto c = store.CreateChannel(MakeChannel("fk", "https://fk"));
  const auto s = store.CreateSource(MakeSource(c, "https://fk/source"));
  assert(Throws<feedstore::util::ForeignKeyViolation>([&] { store.UpdateSource(s, MakeSource(4242, "https://fk/source")); }));
  assert(store.ListSources()[0].channel_id == c);
  store.DeleteChannel(c);
}

void TestSiteTypeEnumeration(EntityStore& store) {
  const auto c = store.CreateChannel(MakeChannel("enum", "https://enum"));
  const auto s = store.CreateSource(MakeSource(c, "https://enum/source"));

  bool threw = false;
  try {
    store.CreateSite(MakeSite(s, "https://enum/site", "LEASE"));
  } catch (const feedstore::util::InvalidEnum& e) {
    threw = true;
    assert(e.field() == "site_type");
  }
  assert(threw);
  assert(store.ListSites().empty());

  const auto t = store.CreateSite(MakeSite(s, "https://enum/site", "BUY"));
  assert(Throws<feedstore::util::InvalidEnum>([&] { store.UpdateSite(t, MakeSite(s, "https://enum/site", "LEASE")); }));
  assert(Throws<feedstore::util::InvalidEnum>([&] { store.UpdateSite(t, MakeSite(s, "https://enum/site", "buy")); }));
  assert(store.ListSites()[0].site_type == "BUY");

  for (const char* type : {"AUTO", "RENT", "BUY", "FREE"}) {
    store.UpdateSite(t, MakeSite(s, "https://enum/site", type));
    assert(store.ListSites()[0].site_type == type);
  }
  store.DeleteChannel(c);
}

void TestNotFound(EntityStore& store) {
  const auto c = store.CreateChannel(MakeChannel("stable", "https://stable"));
  const auto s = store.CreateSource(MakeSource(c, "https://stable/source", true));
  const auto t = store.CreateSite(MakeSite(s, "https://stable/site", "RENT"));

  const auto sources_before = store.ListSources();
  const auto sites_before   = store.ListSites();

  // parents are valid, so only the missing id can fail
  assert(Throws<feedstore::util::NotFound>([&] { store.UpdateChannel(999, MakeChannel("x", "https://y")); }));
  assert(Throws<feedstore::util::NotFound>([&] { store.UpdateSource(999, MakeSource(c, "https://other/source")); }));
  assert(Throws<feedstore::util::NotFound>([&] { store.UpdateSite(999, MakeSite(s, "https://other/site", "FREE")); }));
  assert(store.ListSources() == sources_before);
  assert(store.ListSites() == sites_before);
  assert(store.ListSites()[0].id == t);
  assert(Throws<feedstore::util::NotFound>([&] { store.DeleteChannel(999); }));
  assert(Throws<feedstore::util::NotFound>([&] { store.DeleteSource(999); }));
  assert(Throws<feedstore::util::NotFound>([&] { store.DeleteSite(999); }));
  assert(Throws<feedstore::util::NotFound>([&] { store.EffectiveForbiddenWords(999); }));

  const auto channels = store.ListChannels();
  assert(channels.size() == 1);
  assert(channels[0].name == "stable");

  store.DeleteChannel(c);
  assert(Throws<feedstore::util::NotFound>([&] { store.DeleteChannel(c); }));
}

void TestRequiredFields(EntityStore& store) {
  assert(Throws<feedstore::util::InvalidArgument>([&] { store.CreateChannel(MakeChannel("", "https://blank")); }));
  assert(Throws<feedstore::util::InvalidArgument>([&] { store.CreateChannel(MakeChannel("blank", "  ")); }));
  assert(store.ListChannels().empty());

  const auto c = store.CreateChannel(MakeChannel("required", "https://required"));
  assert(Throws<feedstore::util::InvalidArgument>([&] { store.CreateSource(MakeSource(c, "")); }));
  const auto s = store.CreateSource(MakeSource(c, "https://required/source"));
  assert(Throws<feedstore::util::InvalidArgument>([&] { store.CreateSite(MakeSite(s, "")); }));
  store.DeleteChannel(c);
}

void TestInvalidUtf8ListIsRejected(EntityStore& store) {
  Channel bad         = MakeChannel("utf8", "https://utf8");
  bad.forbidden_words = {"caf\xe9"};

  bool threw = false;
  try {
    store.CreateChannel(bad);
  } catch (const feedstore::util::InvalidArgument& e) {
    threw = true;
    assert(e.field() == "forbidden_words");
  }
  assert(threw);
  assert(store.ListChannels().empty());

  const auto c = store.CreateChannel(MakeChannel("utf8", "https://utf8"));

  Channel bad_times    = MakeChannel("utf8", "https://utf8");
  bad_times.post_times = {"09:00", "\xff\xfe"};
  assert(Throws<feedstore::util::InvalidArgument>([&] { store.UpdateChannel(c, bad_times); }));
  assert((store.ListChannels()[0].post_times == std::vector<std::string>{"09:00", "18:00"}));

  Source bad_source          = MakeSource(c, "https://utf8/source");
  bad_source.forbidden_words = {"\xc3"};
  assert(Throws<feedstore::util::InvalidArgument>([&] { store.CreateSource(bad_source); }));
  assert(store.ListSources().empty());

  // valid multi-byte text round-trips unchanged
  Channel accented         = MakeChannel("utf8", "https://utf8");
  accented.forbidden_words = {"caf\xc3\xa9", "日本語"};
  store.UpdateChannel(c, accented);
  assert(store.ListChannels()[0].forbidden_words == accented.forbidden_words);

  store.DeleteChannel(c);
}

void TestUpdateIsFullReplace(EntityStore& store) {
  const auto c = store.CreateChannel(MakeChannel("replace", "https://replace"));
  const auto s = store.CreateSource(MakeSource(c, "https://replace/source", true));

  Source updated      = MakeSource(c, "https://replace/source2", false);
  updated.id          = 12345;
  updated.forbidden_words = {"b", "a", "b"};
  store.UpdateSource(s, updated);

  const auto sources = store.ListSources();
  assert(sources.size() == 1);
  assert(sources[0].id == s);
  assert(sources[0].source_url == "https://replace/source2");
  assert(!sources[0].parse_media);
  assert((sources[0].forbidden_words == std::vector<std::string>{"b", "a", "b"}));

  Channel cleared = MakeChannel("replace", "https://replace");
  cleared.post_times.clear();
  cleared.forbidden_words.clear();
  store.UpdateChannel(c, cleared);
  assert(store.ListChannels()[0].post_times.empty());
  assert(store.ListChannels()[0].forbidden_words.empty());

  store.DeleteChannel(c);
}

void TestListsAreInIdOrderAndFiltered(EntityStore& store) {
  const auto c1 = store.CreateChannel(MakeChannel("order1", "https://order1"));
  const auto c2 = store.CreateChannel(MakeChannel("order2", "https://order2"));
  const auto s1 = store.CreateSource(MakeSource(c1, "https://a"));
  const auto s2 = store.CreateSource(MakeSource(c2, "https://b"));
  const auto s3 = store.CreateSource(MakeSource(c1, "https://c"));
  store.CreateSite(MakeSite(s2, "https://b/1"));
  store.CreateSite(MakeSite(s2, "https://b/2", "FREE"));

  const auto all = store.ListSources();
  assert(all.size() == 3);
  assert(all[0].id == s1 && all[1].id == s2 && all[2].id == s3);

  const auto of_c1 = store.SourcesOf(c1);
  assert(of_c1.size() == 2);
  assert(of_c1[0].id == s1 && of_c1[1].id == s3);

  assert(store.SitesOf(s1).empty());
  const auto of_s2 = store.SitesOf(s2);
  assert(of_s2.size() == 2);
  assert(of_s2[1].site_type == "FREE");

  store.DeleteChannel(c1);
  store.DeleteChannel(c2);
}

void TestIdsAreNotReused(EntityStore& store) {
  const auto a = store.CreateChannel(MakeChannel("ids-a", "https://ids/a"));
  store.DeleteChannel(a);
  const auto b = store.CreateChannel(MakeChannel("ids-b", "https://ids/b"));
  assert(b > a);
  store.DeleteChannel(b);
}

void TestEffectiveForbiddenWords(EntityStore& store) {
  Channel channel         = MakeChannel("words", "https://words");
  channel.forbidden_words = {"spam", "ads"};
  const auto c            = store.CreateChannel(channel);

  Source source          = MakeSource(c, "https://words/source");
  source.forbidden_words = {"crypto", "spam", "casino"};
  const auto s           = store.CreateSource(source);

  assert((store.EffectiveForbiddenWords(s) == std::vector<std::string>{"spam", "ads", "crypto", "casino"}));
  store.DeleteChannel(c);
}

void TestKindDispatch(EntityStore& store) {
  const auto c = store.Create(MakeChannel("generic", "https://generic"));
  const auto s = store.Create(MakeSource(c, "https://generic/source"));
  const auto t = store.Create(MakeSite(s, "https://generic/site"));

  const auto sites = store.List(EntityKind::kSite);
  assert(sites.size() == 1);
  assert(feedstore::model::KindOf(sites[0]) == EntityKind::kSite);
  assert(feedstore::model::EntityId(sites[0]) == t);
  assert(feedstore::model::ParentId(sites[0]) == s);

  store.Update(t, MakeSite(s, "https://generic/site2", "FREE"));
  assert(std::get<Site>(store.List(EntityKind::kSite)[0]).site_url == "https://generic/site2");

  store.Delete(EntityKind::kSource, s);
  assert(store.List(EntityKind::kSite).empty());
  assert(store.List(EntityKind::kChannel).size() == 1);
  store.Delete(EntityKind::kChannel, c);
}

void TestClosedStoreRejectsCalls(std::unique_ptr<EntityStore> store) {
  assert(store->IsOpen());
  store->Close();
  assert(!store->IsOpen());
  assert(Throws<feedstore::util::StorageUnavailable>([&] { store->ListChannels(); }));
  store->Close();
}

void RunSuite(Backend& backend) {
  std::cout << "running entity store suite: " << backend.name << "\n";

  auto store = backend.open();
  TestEndToEndChannelLifecycle(*store);
  TestCascadeDelete(*store);
  TestUniqueUrl(*store);
  TestForeignKeys(*store);
  TestSiteTypeEnumeration(*store);
  TestNotFound(*store);
  TestRequiredFields(*store);
  TestInvalidUtf8ListIsRejected(*store);
  TestUpdateIsFullReplace(*store);
  TestListsAreInIdOrderAndFiltered(*store);
  TestIdsAreNotReused(*store);
  TestEffectiveForbiddenWords(*store);
  TestKindDispatch(*store);
  TestClosedStoreRejectsCalls(std::move(store));

  backend.cleanup();
}

Backend MakeMemoryBackend() {
  return Backend{
      .name    = "memory",
      .open    = []() { return std::make_unique<EntityStore>(std::make_shared<feedstore::db::memory::MemoryRepository>()); },
      .cleanup = []() {},
  };
}

Backend MakeSqliteBackend() {
  const auto stamp   = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto db_path = (std::filesystem::temp_directory_path() / ("feedstore_entity_store_" + std::to_string(stamp) + ".db")).string();

  return Backend{
      .name = "sqlite",
      .open =
          [db_path]() {
            auto db = std::make_shared<feedstore::db::sqlite::SqliteDB>(db_path);
            feedstore::db::sqlite::EnsureSchema(*db);
            return std::make_unique<EntityStore>(std::make_shared<feedstore::db::sqlite::SqliteRepository>(std::move(db)));
          },
      .cleanup = [db_path]() { std::filesystem::remove(db_path); },
  };
}

void TestCorruptStoredListIsReported() {
  const auto stamp   = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto db_path = (std::filesystem::temp_directory_path() / ("feedstore_entity_store_corrupt_" + std::to_string(stamp) + ".db")).string();

  auto db = std::make_shared<feedstore::db::sqlite::SqliteDB>(db_path);
  feedstore::db::sqlite::EnsureSchema(*db);
  db->Exec("INSERT INTO channels(name,url,post_times,forbidden_words) VALUES('legacy','https://legacy',NULL,'');");
  db->Exec("INSERT INTO channels(name,url,post_times,forbidden_words) VALUES('broken','https://broken','09:00','[]');");

  EntityStore store(std::make_shared<feedstore::db::sqlite::SqliteRepository>(db));

  bool threw = false;
  try {
    store.ListChannels();
  } catch (const feedstore::util::Corruption& e) {
    threw = true;
    assert(e.field() == "post_times");
    assert(e.entity_id() == 2);
  }
  assert(threw);

  // rows written without list values read back as empty lists
  db->Exec("DELETE FROM channels WHERE name = 'broken';");
  const auto channels = store.ListChannels();
  assert(channels.size() == 1);
  assert(channels[0].post_times.empty());
  assert(channels[0].forbidden_words.empty());

  store.Close();
  std::filesystem::remove(db_path);
}

} // namespace

int main() {
  std::vector<Backend> backends;
  backends.push_back(MakeMemoryBackend());
  backends.push_back(MakeSqliteBackend());

  for (auto& backend : backends) {
    RunSuite(backend);
  }
  TestCorruptStoredListIsReported();

  std::cout << "feedstore_unit_entity_store: pass\n";
  return 0;
}
