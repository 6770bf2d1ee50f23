#include "factory.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace feedstore::factory {

using feedstore::observability::BoolField;
using feedstore::observability::IntField;
using feedstore::observability::StringField;

namespace {

constexpr int kDefaultBusyTimeoutMs = 5000;

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const feedstore::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();

  if (database.has_sqlite()) {
    const auto& sqlite = database.sqlite();

    const uint32_t busy_timeout_ms = std::min<uint32_t>(sqlite.busy_timeout_ms(), std::numeric_limits<int>::max());

    db::sqlite::SqliteOptions options;
    options.busy_timeout_ms = busy_timeout_ms > 0 ? static_cast<int>(busy_timeout_ms) : kDefaultBusyTimeoutMs;
    options.wal_mode        = sqlite.wal_mode();

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), options);
    db::sqlite::EnsureSchema(*sqlite_db);

    FEEDSTORE_LOG_INFO("Opened sqlite store", {StringField("path", sqlite.path()), IntField("busy_timeout_ms", options.busy_timeout_ms),
                                               BoolField("wal_mode", options.wal_mode)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  if (database.has_memory()) {
    FEEDSTORE_LOG_INFO("Opened in-memory store");
    return std::make_shared<db::memory::MemoryRepository>();
  }

  throw util::StorageUnavailable("no database backend configured");
}

/*
    Build full application dependency graph
*/
Application Build(const feedstore::runtime::config::RuntimeConfig& config) {
  Application app;
  app.store = std::make_shared<store::EntityStore>(BuildRepository(config));
  return app;
}

} // namespace feedstore::factory
