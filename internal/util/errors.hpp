#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace projsync::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Derivation rejected a base row. Carries the key and the offending column.
*/
class DomainError : public std::runtime_error {
 public:
  DomainError(std::int64_t key, std::string column, const std::string& msg)
      : std::runtime_error("key " + std::to_string(key) + " column '" + column + "': " + msg), key_(key),
        column_(std::move(column)) {
  }

  std::int64_t key() const {
    return key_;
  }
  const std::string& column() const {
    return column_;
  }

 private:
  std::int64_t key_;
  std::string  column_;
};

class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DeadlineExceeded : public std::runtime_error {
 public:
  explicit DeadlineExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SyncFailed : public std::runtime_error {
 public:
  explicit SyncFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Sequence numbers for a key went backwards or repeated.
class OrderingViolation : public std::runtime_error {
 public:
  explicit OrderingViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace projsync::util
