#include "rollback_coordinator.hpp"

#include "internal/model/lifecycle.hpp"
#include "internal/observability/logging.hpp"

namespace statecore::rollback {

namespace {

using observability::IntField;
using observability::StringField;

} // namespace

RollbackCoordinator::RollbackCoordinator(std::shared_ptr<txn::TransactionManager> transactions, std::shared_ptr<store::VersionStore> versions,
                                         std::shared_ptr<store::EventLog> events)
    : transactions_(std::move(transactions)), versions_(std::move(versions)), events_(std::move(events)) {
}

txn::Status RollbackCoordinator::Resolve(const model::EntityKey& key, const RollbackTarget& target, Source& out) {
  const auto name = model::KeyString(key);

  try {
    if (target.version) {
      auto snapshot = versions_->Get(key, *target.version);
      if (!snapshot) {
        return {txn::StatusCode::kNotFound, name + " has no version " + std::to_string(*target.version)};
      }
      out.payload = snapshot->payload();
      out.version = snapshot->version();
      return txn::Status::Ok();
    }

    if (target.time_ms) {
      auto state = events_->ReconstructAtTime(key, *target.time_ms);
      if (!state) {
        return {txn::StatusCode::kNotFound, name + " did not exist at " + std::to_string(*target.time_ms)};
      }
      out.payload = std::move(state->payload);
      out.version = state->version;
      return txn::Status::Ok();
    }
  } catch (const std::exception& e) {
    return {txn::StatusCode::kStorageError, e.what()};
  }

  return {txn::StatusCode::kInvalidState, "rollback target needs a version or a timestamp"};
}

RollbackResult RollbackCoordinator::RollbackTo(const model::EntityKey& key, const RollbackTarget& target, const std::string& reason,
                                               const std::string& actor) {
  RollbackResult result;
  const auto     name = model::KeyString(key);

  Source source;
  result.status = Resolve(key, target, source);
  if (!result.status.ok()) return result;
  result.source_version = source.version;

  auto txn = transactions_->Begin(txn::Mode::kPessimistic, actor);
  if (auto status = txn->Lock({name}); !status.ok()) {
    transactions_->Abort(*txn);
    result.status = std::move(status);
    return result;
  }

  auto current = txn->ReadEntity(key);
  if (!current.status.ok()) {
    transactions_->Abort(*txn);
    result.status = std::move(current.status);
    return result;
  }

  txn::WriteOptions options;
  options.event_type                           = std::string(model::kEventRollback);
  options.replace                              = true;
  options.metadata["rollback_source_version"]  = std::to_string(source.version);
  options.metadata["rolled_back_from_version"] = std::to_string(current.snapshot->version());
  options.metadata["reason"]                   = reason;
  options.metadata["actor"]                    = actor;
  if (target.time_ms) options.metadata["rollback_source_time_ms"] = std::to_string(*target.time_ms);

  auto status = txn->StageWrite(
      key, [&source](google::protobuf::Struct& payload) { payload = source.payload; }, std::move(options));
  if (!status.ok()) {
    transactions_->Abort(*txn);
    result.status = std::move(status);
    return result;
  }

  auto commit   = transactions_->Commit(*txn);
  result.status = std::move(commit.status);
  if (!result.status.ok()) return result;

  for (const auto& [committed_key, version] : commit.committed) {
    if (model::SameKey(committed_key, key)) result.new_version = version;
  }

  STATECORE_LOG_INFO("entity rolled back", {StringField("key", name), IntField("source_version", static_cast<int64_t>(source.version)),
                                            IntField("new_version", static_cast<int64_t>(result.new_version)),
                                            StringField("reason", reason), StringField("actor", actor)});
  return result;
}

} // namespace statecore::rollback
