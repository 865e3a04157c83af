#include "result.hpp"

#include <stdexcept>

namespace projsync::db {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

void ThrowIfError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const std::string msg = context + ": " + ToString(result.code) + (result.message.empty() ? "" : " (" + result.message + ")");

  switch (result.code) {
    case ErrorCode::Busy:
    case ErrorCode::SerializationFailure:
    case ErrorCode::IOError:
      throw util::StoreUnavailable(msg);
    case ErrorCode::NotFound:
      throw util::NotFound(msg);
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
      throw util::InvalidArgument(msg);
    default:
      throw std::runtime_error(msg);
  }
}

} // namespace projsync::db
