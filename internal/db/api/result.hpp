#pragma once

#include <string>

#include "internal/util/errors.hpp"

namespace projsync::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

const char* ToString(ErrorCode code);

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

/*
  Raises the engine error for a failed result.

    Busy, SerializationFailure, IOError -> util::StoreUnavailable
    NotFound                            -> util::NotFound
    AlreadyExists, ConstraintViolation  -> util::InvalidArgument
    anything else                       -> std::runtime_error
*/
void ThrowIfError(const Result& result, const std::string& context);

} // namespace projsync::db
