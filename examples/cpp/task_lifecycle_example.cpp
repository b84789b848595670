#include <iostream>
#include <string>

#include "config/config.pb.h"
#include "internal/factory.hpp"
#include "internal/model/entity_key.hpp"
#include "internal/store/codec.hpp"

using namespace statecore;

namespace {

txn::Mutator SetStatus(const std::string& status) {
  return [status](google::protobuf::Struct& payload) { (*payload.mutable_fields())["status"].set_string_value(status); };
}

} // namespace

int main() {
  // In-memory backend; pass a RuntimeConfig with a sqlite section for durability.
  statecore::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();

  auto  runtime = factory::Build(config);
  auto& manager = *runtime.manager;

  manager.Subscribe([](const v1::CommittedEvent& event) {
    std::cout << "  event " << model::KeyString(event.key()) << " v" << event.version() << " " << event.event_type() << " by "
              << event.actor() << '\n';
  });

  const auto t1 = model::MakeKey(v1::ENTITY_TYPE_TASK, "T1");

  // Task/T1 starts pending at version 1.
  auto create = manager.RunWithRetry(
      txn::Mode::kOptimistic, [&](txn::Transaction& txn) { return txn.StageWrite(t1, SetStatus("pending")); }, {}, "scheduler");
  if (!create.status.ok()) {
    std::cerr << "create failed: " << create.status.ToString() << '\n';
    return 1;
  }

  // Two optimistic transactions read v1 and race.
  auto a = manager.BeginTransaction(txn::Mode::kOptimistic, "agent-a");
  auto b = manager.BeginTransaction(txn::Mode::kOptimistic, "agent-b");
  a->ReadEntity(t1);
  b->ReadEntity(t1);
  a->StageWrite(t1, SetStatus("running"));
  b->StageWrite(t1, SetStatus("running"));

  std::cout << "A commit: " << manager.Commit(*a).status.ToString() << '\n';
  std::cout << "B commit: " << manager.Commit(*b).status.ToString() << '\n';

  // B re-reads and cancels instead.
  auto retry = manager.BeginTransaction(txn::Mode::kOptimistic, "agent-b");
  retry->ReadEntity(t1);
  retry->StageWrite(t1, SetStatus("cancelled"));
  std::cout << "B retry: " << manager.Commit(*retry).status.ToString() << '\n';

  std::cout << "history:";
  for (const auto& info : manager.GetHistory(t1)) {
    std::cout << ' ' << info.version() << '(' << info.event_type() << ')';
  }
  std::cout << '\n';

  auto rolled = manager.RollbackTo(t1, rollback::RollbackTarget::Version(1), "operator reset", "ops");
  if (!rolled.status.ok()) {
    std::cerr << "rollback failed: " << rolled.status.ToString() << '\n';
    return 1;
  }

  const auto current = manager.GetEntity(t1);
  std::cout << "after rollback: v" << current.version() << ' ' << store::PayloadToJson(current.payload()) << '\n';

  runtime.publisher->Flush();
  return 0;
}
