#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace feedstore::util {

/*
  Central error types raised by the entity store.

  Every error keeps the offending field and/or entity id so a front end can
  point the operator at the exact input that was rejected.
*/

class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg, std::string field = {}, std::optional<int64_t> entity_id = std::nullopt)
      : std::runtime_error(msg), field_(std::move(field)), entity_id_(entity_id) {
  }

  const std::string& field() const {
    return field_;
  }

  std::optional<int64_t> entity_id() const {
    return entity_id_;
  }

 private:
  std::string            field_;
  std::optional<int64_t> entity_id_;
};

// Backing store cannot be opened, configured or bootstrapped. Fatal.
class StorageUnavailable : public StoreError {
 public:
  using StoreError::StoreError;
};

class UniqueConstraintViolation : public StoreError {
 public:
  using StoreError::StoreError;
};

class ForeignKeyViolation : public StoreError {
 public:
  using StoreError::StoreError;
};

class InvalidEnum : public StoreError {
 public:
  using StoreError::StoreError;
};

// Required field missing or a value that cannot be stored.
class InvalidArgument : public StoreError {
 public:
  using StoreError::StoreError;
};

class NotFound : public StoreError {
 public:
  using StoreError::StoreError;
};

// Another writer holds the database lock. Safe to retry with backoff.
class LockContention : public StoreError {
 public:
  using StoreError::StoreError;
};

// A stored value could not be decoded.
class Corruption : public StoreError {
 public:
  using StoreError::StoreError;
};

} // namespace feedstore::util
