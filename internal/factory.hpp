#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/store/entity_store.hpp"

namespace feedstore::factory {

/*
  Application

  Owns the long-lived objects a front end works with.
*/
struct Application {
  std::shared_ptr<store::EntityStore> store;
};

/*
  BuildRepository

  Opens the backend named by config.database(). For sqlite the schema is
  ensured before the repository is handed out.

  NOTE:
  This is the ONLY place allowed to know concrete DB types.
  Throws util::StorageUnavailable when the store cannot be opened.
*/
std::shared_ptr<db::Repository> BuildRepository(const feedstore::runtime::config::RuntimeConfig& config);

Application Build(const feedstore::runtime::config::RuntimeConfig& config);

} // namespace feedstore::factory
