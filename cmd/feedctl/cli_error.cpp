#include "cli_error.hpp"

#include "internal/util/errors.hpp"

namespace feedstore::cli {

int ToExitCode(const std::exception& e) {
  using namespace feedstore::util;

  if (dynamic_cast<const StorageUnavailable*>(&e)) {
    return kExitStorageUnavailable;
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return kExitNotFound;
  }
  if (dynamic_cast<const UniqueConstraintViolation*>(&e) || dynamic_cast<const ForeignKeyViolation*>(&e) ||
      dynamic_cast<const InvalidEnum*>(&e) || dynamic_cast<const InvalidArgument*>(&e)) {
    return kExitConstraint;
  }
  if (dynamic_cast<const LockContention*>(&e)) {
    return kExitLockContention;
  }

  return kExitOther;
}

std::string Describe(const std::exception& e) {
  using namespace feedstore::util;

  std::string kind = "error";
  if (dynamic_cast<const StorageUnavailable*>(&e)) {
    kind = "storage unavailable";
  } else if (dynamic_cast<const NotFound*>(&e)) {
    kind = "not found";
  } else if (dynamic_cast<const UniqueConstraintViolation*>(&e)) {
    kind = "already exists";
  } else if (dynamic_cast<const ForeignKeyViolation*>(&e)) {
    kind = "unknown parent";
  } else if (dynamic_cast<const InvalidEnum*>(&e)) {
    kind = "invalid value";
  } else if (dynamic_cast<const InvalidArgument*>(&e)) {
    kind = "invalid input";
  } else if (dynamic_cast<const LockContention*>(&e)) {
    kind = "database busy, try again";
  } else if (dynamic_cast<const Corruption*>(&e)) {
    kind = "corrupt record";
  }

  std::string out = kind + ": " + e.what();
  if (const auto* store_error = dynamic_cast<const StoreError*>(&e)) {
    if (!store_error->field().empty()) {
      out += " [field=" + store_error->field() + "]";
    }
    if (store_error->entity_id()) {
      out += " [id=" + std::to_string(*store_error->entity_id()) + "]";
    }
  }
  return out;
}

} // namespace feedstore::cli
