#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/entity.hpp"

namespace feedstore::db {
class Repository;
}

namespace feedstore::store {

/*
  Typed CRUD over channels, sources and sites.

  Every call is one synchronous unit of work in its own transaction: it
  either commits completely or leaves the store untouched. Failures are
  raised as util::StoreError subclasses (see internal/util/errors.hpp)
  naming the offending field and/or id:

    Create/Update  InvalidArgument            required text field blank
                   InvalidEnum                site_type not AUTO/RENT/BUY/FREE
                   ForeignKeyViolation        parent id does not exist
                   UniqueConstraintViolation  channel name or url taken
    Update/Delete  NotFound                   id does not exist
    any            LockContention             another writer holds the lock

  Nothing is retried here; retry policy belongs to the caller.

  Update is a full-record replace: every field of the argument is written,
  its id member is ignored in favour of the explicit id. Delete cascades to
  descendants in storage.

  The store owns the repository (and through it the connection) until
  Close() or destruction.
*/
class EntityStore {
 public:
  explicit EntityStore(std::shared_ptr<db::Repository> repository);
  ~EntityStore();

  EntityStore(const EntityStore&)            = delete;
  EntityStore& operator=(const EntityStore&) = delete;

  // Channels
  std::vector<model::Channel> ListChannels();
  int64_t                     CreateChannel(const model::Channel& fields);
  void                        UpdateChannel(int64_t id, const model::Channel& fields);
  void                        DeleteChannel(int64_t id);

  // Sources
  std::vector<model::Source> ListSources();
  std::vector<model::Source> SourcesOf(int64_t channel_id);
  int64_t                    CreateSource(const model::Source& fields);
  void                       UpdateSource(int64_t id, const model::Source& fields);
  void                       DeleteSource(int64_t id);

  // Sites
  std::vector<model::Site> ListSites();
  std::vector<model::Site> SitesOf(int64_t source_id);
  int64_t                  CreateSite(const model::Site& fields);
  void                     UpdateSite(int64_t id, const model::Site& fields);
  void                     DeleteSite(int64_t id);

  // Kind-dispatched forms of the above.
  std::vector<model::Entity> List(model::EntityKind kind);
  int64_t                    Create(const model::Entity& fields);
  void                       Update(int64_t id, const model::Entity& fields);
  void                       Delete(model::EntityKind kind, int64_t id);

  // Words a worker must filter for a source: the channel's list followed by
  // the source's own additions, duplicates dropped, first occurrence kept.
  std::vector<std::string> EffectiveForbiddenWords(int64_t source_id);

  // Releases the repository. Later calls throw util::StorageUnavailable.
  void Close();
  bool IsOpen() const;

 private:
  db::Repository& Repo();

  std::shared_ptr<db::Repository> repository_;
};

} // namespace feedstore::store
