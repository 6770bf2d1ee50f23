#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace feedstore::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  UniqueConstraintViolation,
  ForeignKeyViolation,
  InvalidEnum,
  InvalidArgument,
  Busy,

  IOError,
  Corruption,

  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  // offending column / row, when the backend can tell
  std::string            field;
  std::optional<int64_t> entity_id;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}, std::string field = {}, std::optional<int64_t> entity_id = std::nullopt) {
    return {c, std::move(msg), std::move(field), entity_id};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::UniqueConstraintViolation:
      return "unique_constraint_violation";
    case ErrorCode::ForeignKeyViolation:
      return "foreign_key_violation";
    case ErrorCode::InvalidEnum:
      return "invalid_enum";
    case ErrorCode::InvalidArgument:
      return "invalid_argument";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

} // namespace feedstore::db
