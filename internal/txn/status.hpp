#pragma once

#include <string>

namespace statecore::txn {

enum class StatusCode {
  kOk = 0,
  kNotFound,
  kOptimisticConflict,
  kLockTimeout,
  kLockExpired,
  kStorageError,
  kConflictError,
  kInvalidState,
};

const char* ToString(StatusCode code);

/*
  Typed outcome of a transaction operation.

  Conflicts and lock failures are ordinary values, not exceptions, so the
  retry decision is an explicit branch at the call site.
*/
class Status {
 public:
  Status() = default;
  Status(StatusCode code, std::string message) : code_(code), message_(std::move(message)) {
  }

  static Status Ok() {
    return {};
  }

  StatusCode code() const {
    return code_;
  }
  const std::string& message() const {
    return message_;
  }

  bool ok() const {
    return code_ == StatusCode::kOk;
  }

  // Only optimistic conflicts and lock timeouts may be retried automatically.
  bool IsRetryable() const {
    return code_ == StatusCode::kOptimisticConflict || code_ == StatusCode::kLockTimeout;
  }

  std::string ToString() const;

 private:
  StatusCode  code_ = StatusCode::kOk;
  std::string message_;
};

} // namespace statecore::txn
