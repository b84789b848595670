#pragma once

#include <stdexcept>
#include <string>

namespace statecore::util {

/*
  Central error types.

  Conflicts and lock failures on the commit path are reported as typed
  txn::Status values, not exceptions. These cover the remaining cases.
*/

// Entity or version absent on a read path.
class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Operation not allowed in the current state (finished handle, terminal entity).
class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Internal invariant violation. Always fatal, never retried.
class ConflictError : public std::runtime_error {
 public:
  explicit ConflictError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Backing store unavailable or failed on a read path.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace statecore::util
