#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "google/protobuf/struct.pb.h"
#include "internal/lock/lock.hpp"
#include "internal/model/entity_key.hpp"
#include "statecore/v1/entity.pb.h"
#include "status.hpp"

namespace statecore::txn {

class TransactionManager;

enum class Mode {
  kOptimistic,
  kPessimistic,
};

const char* ToString(Mode mode);

using Mutator = std::function<void(google::protobuf::Struct&)>;

struct WriteOptions {
  // Defaults to entity_created / entity_updated.
  std::string                        event_type;
  std::map<std::string, std::string> metadata;
  // Payload becomes exactly what the mutator produces from an empty payload.
  bool replace = false;
};

struct ReadResult {
  Status                            status;
  std::optional<v1::EntitySnapshot> snapshot;
};

/*
  Transaction handle.

  Staged writes live here until Commit and are invisible to everyone else.
  A handle is single-use and not thread-safe; destroying an active handle
  aborts it. Reads go to the Version Store, never to the cache.
*/
class Transaction {
 public:
  ~Transaction();

  Transaction(const Transaction&)            = delete;
  Transaction& operator=(const Transaction&) = delete;

  const std::string& Id() const {
    return id_;
  }
  Mode mode() const {
    return mode_;
  }
  const std::string& Actor() const {
    return actor_;
  }
  bool IsActive() const {
    return active_;
  }

  // Pessimistic mode only. Keys are logical lock names, typically KeyString(key).
  Status Lock(const std::vector<std::string>& keys, std::optional<lock::AcquireOptions> options = std::nullopt);

  // Records the version token; the payload reflects this handle's staged writes.
  ReadResult ReadEntity(const model::EntityKey& key);

  Status StageWrite(const model::EntityKey& key, const Mutator& mutator, WriteOptions options = {});

  // Sets the terminal status. The entity must exist.
  Status StageDelete(const model::EntityKey& key, const std::string& reason);

 private:
  friend class TransactionManager;

  Transaction(TransactionManager& manager, std::string id, Mode mode, std::string actor);

  // Version observed at first read; 0 when the entity did not exist.
  struct ReadEntry {
    model::EntityKey                  key;
    uint64_t                          version = 0;
    std::optional<v1::EntitySnapshot> snapshot;
  };

  struct StagedWrite {
    model::EntityKey                   key;
    google::protobuf::Struct           payload;
    std::string                        event_type;
    std::map<std::string, std::string> metadata;
    bool                               replace = false;
  };

  void   EnsureActive(const char* operation) const;
  Status EnsureLocked(const std::string& key);
  Status Observe(const model::EntityKey& key, ReadEntry** entry);

  TransactionManager& manager_;
  std::string         id_;
  Mode                mode_;
  std::string         actor_;
  bool                active_ = true;

  // Keyed by KeyString so commit order is canonical.
  std::map<std::string, ReadEntry>   reads_;
  std::map<std::string, StagedWrite> writes_;
  std::set<std::string>              locked_keys_;
};

} // namespace statecore::txn
