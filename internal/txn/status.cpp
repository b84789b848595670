#include "status.hpp"

namespace statecore::txn {

const char* ToString(StatusCode code) {
  switch (code) {
    case StatusCode::kOk:
      return "OK";
    case StatusCode::kNotFound:
      return "NOT_FOUND";
    case StatusCode::kOptimisticConflict:
      return "OPTIMISTIC_CONFLICT";
    case StatusCode::kLockTimeout:
      return "LOCK_TIMEOUT";
    case StatusCode::kLockExpired:
      return "LOCK_EXPIRED";
    case StatusCode::kStorageError:
      return "STORAGE_ERROR";
    case StatusCode::kConflictError:
      return "CONFLICT_ERROR";
    case StatusCode::kInvalidState:
      return "INVALID_STATE";
  }
  return "UNKNOWN";
}

std::string Status::ToString() const {
  if (message_.empty()) return txn::ToString(code_);
  return std::string(txn::ToString(code_)) + ": " + message_;
}

} // namespace statecore::txn
