#include "transaction.hpp"

#include "internal/model/lifecycle.hpp"
#include "internal/util/errors.hpp"
#include "transaction_manager.hpp"

namespace statecore::txn {

const char* ToString(Mode mode) {
  return mode == Mode::kPessimistic ? "pessimistic" : "optimistic";
}

Transaction::Transaction(TransactionManager& manager, std::string id, Mode mode, std::string actor)
    : manager_(manager), id_(std::move(id)), mode_(mode), actor_(std::move(actor)) {
}

Transaction::~Transaction() {
  if (active_) manager_.Abort(*this);
}

void Transaction::EnsureActive(const char* operation) const {
  if (!active_) {
    throw util::InvalidState(std::string(operation) + ": transaction " + id_ + " already finished");
  }
}

Status Transaction::Lock(const std::vector<std::string>& keys, std::optional<lock::AcquireOptions> options) {
  EnsureActive("lock");
  if (mode_ != Mode::kPessimistic) {
    return {StatusCode::kInvalidState, "locks require a pessimistic transaction"};
  }

  auto opts = options.value_or(manager_.locks_->Defaults());
  if (opts.holder.empty()) opts.holder = actor_;

  switch (manager_.locks_->Acquire(id_, keys, opts)) {
    case lock::LockStatus::kAcquired:
      locked_keys_.insert(keys.begin(), keys.end());
      return Status::Ok();
    case lock::LockStatus::kTimeout:
      return {StatusCode::kLockTimeout, "lock acquisition timed out"};
    case lock::LockStatus::kExpired:
      break;
  }
  return {StatusCode::kLockExpired, "lock expired"};
}

Status Transaction::EnsureLocked(const std::string& key) {
  if (mode_ != Mode::kPessimistic || locked_keys_.count(key) > 0) return Status::Ok();
  return Lock({key});
}

Status Transaction::Observe(const model::EntityKey& key, ReadEntry** entry) {
  const auto name = model::KeyString(key);

  if (auto status = EnsureLocked(name); !status.ok()) return status;

  auto it = reads_.find(name);
  if (it == reads_.end()) {
    ReadEntry read;
    read.key = key;
    try {
      read.snapshot = manager_.versions_->Get(key);
    } catch (const std::exception& e) {
      return {StatusCode::kStorageError, e.what()};
    }
    read.version = read.snapshot ? read.snapshot->version() : 0;
    it           = reads_.emplace(name, std::move(read)).first;
  }

  *entry = &it->second;
  return Status::Ok();
}

ReadResult Transaction::ReadEntity(const model::EntityKey& key) {
  EnsureActive("read entity");

  ReadEntry* entry = nullptr;
  if (auto status = Observe(key, &entry); !status.ok()) return {status, std::nullopt};

  auto staged = writes_.find(model::KeyString(key));
  if (staged != writes_.end()) {
    v1::EntitySnapshot view = entry->snapshot.value_or(v1::EntitySnapshot{});
    *view.mutable_key()     = key;
    view.set_version(entry->version);
    *view.mutable_payload() = staged->second.payload;
    return {Status::Ok(), std::move(view)};
  }

  if (!entry->snapshot) {
    return {{StatusCode::kNotFound, model::KeyString(key) + " does not exist"}, std::nullopt};
  }
  return {Status::Ok(), entry->snapshot};
}

Status Transaction::StageWrite(const model::EntityKey& key, const Mutator& mutator, WriteOptions options) {
  EnsureActive("stage write");

  ReadEntry* entry = nullptr;
  if (auto status = Observe(key, &entry); !status.ok()) return status;

  const auto name   = model::KeyString(key);
  auto       staged = writes_.find(name);

  const bool                      exists = entry->snapshot.has_value();
  const google::protobuf::Struct* base   = nullptr;
  if (staged != writes_.end()) {
    base = &staged->second.payload;
  } else if (exists) {
    base = &entry->snapshot->payload();
  }

  const bool is_rollback = options.event_type == model::kEventRollback;
  if (base && model::IsTerminal(*base) && !is_rollback) {
    return {StatusCode::kInvalidState, name + " is deleted"};
  }

  google::protobuf::Struct next;
  if (base && !options.replace) next = *base;
  mutator(next);

  StagedWrite write;
  if (staged != writes_.end()) write = std::move(staged->second);
  write.key     = key;
  write.payload = std::move(next);
  write.replace = write.replace || options.replace;
  for (auto& [k, v] : options.metadata) {
    write.metadata[k] = std::move(v);
  }

  if (!options.event_type.empty()) {
    write.event_type = std::move(options.event_type);
  } else if (write.event_type.empty()) {
    write.event_type = std::string(exists ? model::kEventUpdated : model::kEventCreated);
  }

  writes_[name] = std::move(write);
  return Status::Ok();
}

Status Transaction::StageDelete(const model::EntityKey& key, const std::string& reason) {
  EnsureActive("stage delete");

  ReadEntry* entry = nullptr;
  if (auto status = Observe(key, &entry); !status.ok()) return status;
  if (!entry->snapshot && writes_.count(model::KeyString(key)) == 0) {
    return {StatusCode::kNotFound, model::KeyString(key) + " does not exist"};
  }

  WriteOptions options;
  options.event_type = std::string(model::kEventDeleted);
  if (!reason.empty()) options.metadata["reason"] = reason;

  return StageWrite(
      key,
      [](google::protobuf::Struct& payload) {
        (*payload.mutable_fields())[std::string(model::kStatusField)].set_string_value(std::string(model::kStatusDeleted));
      },
      std::move(options));
}

} // namespace statecore::txn
