#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "cmd/feedctl/cli_error.hpp"
#include "cmd/feedctl/text_fields.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/entity.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/entity_store.hpp"

using feedstore::cli::FormatBool;
using feedstore::cli::JoinList;
using feedstore::cli::ParseBool;
using feedstore::cli::ParseId;
using feedstore::cli::SplitList;
using feedstore::model::EntityKind;
using feedstore::store::EntityStore;

namespace cli = feedstore::cli;

static void Usage() {
  std::cerr << "Usage:\n"
            << "  feedctl [--config <file.yaml>] channels list\n"
            << "  feedctl [--config <file.yaml>] channels create <name> <url> [post_times,...] [forbidden_words,...]\n"
            << "  feedctl [--config <file.yaml>] channels update <id> <name> <url> [post_times,...] [forbidden_words,...]\n"
            << "  feedctl [--config <file.yaml>] channels delete <id> --yes\n"
            << "  feedctl [--config <file.yaml>] sources list [channel_id]\n"
            << "  feedctl [--config <file.yaml>] sources create <channel_id> <source_url> [parse_media] [forbidden_words,...]\n"
            << "  feedctl [--config <file.yaml>] sources update <id> <channel_id> <source_url> [parse_media] [forbidden_words,...]\n"
            << "  feedctl [--config <file.yaml>] sources delete <id> --yes\n"
            << "  feedctl [--config <file.yaml>] sources words <id>\n"
            << "  feedctl [--config <file.yaml>] sites list [source_id]\n"
            << "  feedctl [--config <file.yaml>] sites create <source_id> <site_url> [AUTO|RENT|BUY|FREE]\n"
            << "  feedctl [--config <file.yaml>] sites update <id> <source_id> <site_url> [AUTO|RENT|BUY|FREE]\n"
            << "  feedctl [--config <file.yaml>] sites delete <id> --yes\n"
            << "  feedctl [--config <file.yaml>] <channels|sources|sites> init\n";
}

namespace {

struct UsageError {
  std::string message;
};

// args[i] if present, fallback otherwise
std::string Arg(const std::vector<std::string>& args, size_t i, const std::string& fallback = {}) {
  return i < args.size() ? args[i] : fallback;
}

int64_t RequireId(const std::vector<std::string>& args, size_t i, const char* what) {
  if (i >= args.size()) {
    throw UsageError{std::string("missing ") + what};
  }
  auto id = ParseId(args[i]);
  if (!id) {
    throw UsageError{std::string("invalid ") + what + ": '" + args[i] + "'"};
  }
  return *id;
}

void RequireCount(const std::vector<std::string>& args, size_t count) {
  if (args.size() < count) {
    throw UsageError{"missing arguments"};
  }
}

feedstore::model::Channel ChannelFields(const std::vector<std::string>& args, size_t first) {
  RequireCount(args, first + 2);
  feedstore::model::Channel c;
  c.name            = args[first];
  c.url             = args[first + 1];
  c.post_times      = SplitList(Arg(args, first + 2));
  c.forbidden_words = SplitList(Arg(args, first + 3));
  return c;
}

feedstore::model::Source SourceFields(const std::vector<std::string>& args, size_t first) {
  RequireCount(args, first + 2);
  feedstore::model::Source s;
  s.channel_id      = RequireId(args, first, "channel_id");
  s.source_url      = args[first + 1];
  s.parse_media     = ParseBool(Arg(args, first + 2));
  s.forbidden_words = SplitList(Arg(args, first + 3));
  return s;
}

feedstore::model::Site SiteFields(const std::vector<std::string>& args, size_t first) {
  RequireCount(args, first + 2);
  feedstore::model::Site s;
  s.source_id = RequireId(args, first, "source_id");
  s.site_url  = args[first + 1];
  s.site_type = Arg(args, first + 2, "AUTO");
  return s;
}

feedstore::model::Entity Fields(EntityKind kind, const std::vector<std::string>& args, size_t first) {
  switch (kind) {
    case EntityKind::kChannel:
      return ChannelFields(args, first);
    case EntityKind::kSource:
      return SourceFields(args, first);
    case EntityKind::kSite:
      return SiteFields(args, first);
  }
  throw UsageError{"unknown entity kind"};
}

void PrintRow(const feedstore::model::Channel& c) {
  std::cout << c.id << '\t' << c.name << '\t' << c.url << '\t' << JoinList(c.post_times) << '\t' << JoinList(c.forbidden_words) << "\n";
}

void PrintRow(const feedstore::model::Source& s) {
  std::cout << s.id << '\t' << s.channel_id << '\t' << s.source_url << '\t' << FormatBool(s.parse_media) << '\t' << JoinList(s.forbidden_words)
            << "\n";
}

void PrintRow(const feedstore::model::Site& s) {
  std::cout << s.id << '\t' << s.source_id << '\t' << s.site_url << '\t' << s.site_type << "\n";
}

void PrintHeader(EntityKind kind) {
  switch (kind) {
    case EntityKind::kChannel:
      std::cout << "id\tname\turl\tpost_times\tforbidden_words\n";
      return;
    case EntityKind::kSource:
      std::cout << "id\tchannel_id\tsource_url\tparse_media\tforbidden_words\n";
      return;
    case EntityKind::kSite:
      std::cout << "id\tsource_id\tsite_url\tsite_type\n";
      return;
  }
}

int RunList(EntityStore& store, EntityKind kind, const std::vector<std::string>& args) {
  PrintHeader(kind);

  // optional parent filter
  if (args.size() > 0 && kind != EntityKind::kChannel) {
    const int64_t parent = RequireId(args, 0, kind == EntityKind::kSource ? "channel_id" : "source_id");
    if (kind == EntityKind::kSource) {
      for (const auto& s : store.SourcesOf(parent)) PrintRow(s);
    } else {
      for (const auto& s : store.SitesOf(parent)) PrintRow(s);
    }
    return cli::kExitOk;
  }

  for (const auto& entity : store.List(kind)) {
    std::visit([](const auto& row) { PrintRow(row); }, entity);
  }
  return cli::kExitOk;
}

int Run(EntityStore& store, EntityKind kind, const std::string& cmd, const std::vector<std::string>& args) {
  // ------------------------------------------------------------

  if (cmd == "init") {
    std::cout << "ready\n";
    return cli::kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    return RunList(store, kind, args);
  }

  // ------------------------------------------------------------

  if (cmd == "create") {
    const auto id = store.Create(Fields(kind, args, 0));
    std::cout << "created " << feedstore::model::ToString(kind) << " " << id << "\n";
    return cli::kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "update") {
    const auto id = RequireId(args, 0, "id");
    store.Update(id, Fields(kind, args, 1));
    std::cout << "updated " << feedstore::model::ToString(kind) << " " << id << "\n";
    return cli::kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    const auto id = RequireId(args, 0, "id");
    if (Arg(args, 1) != "--yes") {
      std::cerr << "refusing to delete " << feedstore::model::ToString(kind) << " " << id
                << " and everything under it without --yes\n";
      return cli::kExitUsage;
    }
    store.Delete(kind, id);
    std::cout << "deleted " << feedstore::model::ToString(kind) << " " << id << "\n";
    return cli::kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "words" && kind == EntityKind::kSource) {
    const auto id = RequireId(args, 0, "id");
    for (const auto& word : store.EffectiveForbiddenWords(id)) {
      std::cout << word << "\n";
    }
    return cli::kExitOk;
  }

  throw UsageError{"unknown command '" + cmd + "'"};
}

} // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::optional<std::string> config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.size() < 2) {
    Usage();
    return cli::kExitUsage;
  }

  const auto kind = feedstore::model::ParseEntityKind(args[0]);
  if (!kind) {
    std::cerr << "unknown entity kind: " << args[0] << "\n";
    Usage();
    return cli::kExitUsage;
  }
  const std::string              cmd = args[1];
  const std::vector<std::string> rest(args.begin() + 2, args.end());

  feedstore::runtime::config::RuntimeConfig config;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    if (config_path) {
      config = feedstore::config::ConfigLoader::LoadFromYaml(*config_path);
    } else {
      config = feedstore::config::ConfigLoader::Defaults();
      feedstore::config::ConfigLoader::ApplyEnvironment(config);
      feedstore::config::ConfigLoader::Validate(config);
    }
  } catch (const std::exception& e) {
    std::cerr << "config error: " << e.what() << "\n";
    return cli::kExitUsage;
  }

  feedstore::observability::InitializeLogging(config);

  int rc = cli::kExitOk;
  try {
    // ------------------------------------------------------------
    // Open the store and run the command
    // ------------------------------------------------------------
    auto app = feedstore::factory::Build(config);
    rc       = Run(*app.store, *kind, cmd, rest);
    app.store->Close();
  } catch (const UsageError& e) {
    std::cerr << e.message << "\n";
    Usage();
    rc = cli::kExitUsage;
  } catch (const std::exception& e) {
    FEEDSTORE_LOG_ERROR("Command failed", {feedstore::observability::StringField("command", cmd),
                                           feedstore::observability::StringField("error", e.what())});
    std::cerr << cli::Describe(e) << "\n";
    rc = cli::ToExitCode(e);
  }

  feedstore::observability::ShutdownLogging();
  return rc;
}
