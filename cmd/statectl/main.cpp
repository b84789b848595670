#include <google/protobuf/util/json_util.h>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/entity_key.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/codec.hpp"
#include "internal/util/errors.hpp"

using namespace statecore;

static void Usage() {
  std::cout << "Usage:\n"
            << "  statectl --config <file> get <type> <id> [version]\n"
            << "  statectl --config <file> at <type> <id> <unix_ms>\n"
            << "  statectl --config <file> history <type> <id>\n"
            << "  statectl --config <file> events <type> <id>\n"
            << "  statectl --config <file> put <type> <id> <json-fields> [actor]\n"
            << "  statectl --config <file> delete <type> <id> [actor]\n"
            << "  statectl --config <file> rollback <type> <id> <version|@unix_ms> <reason> [actor]\n"
            << "  statectl --config <file> list <type> [limit] [offset]\n"
            << "types: workflow agent task resource system\n";
}

static std::string ToJson(const google::protobuf::Message& message) {
  std::string                                out;
  google::protobuf::util::JsonPrintOptions   options;
  options.preserve_proto_field_names = true;
  auto status = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) throw std::runtime_error("json encode failed: " + std::string(status.message()));
  return out;
}

template <typename T>
static void PrintList(const std::vector<T>& items) {
  std::cout << "[";
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) std::cout << ",";
    std::cout << ToJson(items[i]);
  }
  std::cout << "]\n";
}

static std::optional<uint64_t> ParseNumber(const std::string& text) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) return std::nullopt;
  try {
    return std::stoull(text);
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

static int Failed(const txn::Status& status) {
  std::cerr << status.ToString() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string              config_path = argv[2];
  const std::string              cmd         = argv[3];
  const std::vector<std::string> args(argv + 4, argv + argc);

  // Every command but list takes <type> <id>.
  const std::size_t key_args = cmd == "list" ? 1 : 2;
  if (args.size() < key_args) {
    Usage();
    return 1;
  }

  auto type = model::ParseEntityType(args[0]);
  if (!type) {
    std::cerr << "unknown entity type: " << args[0] << "\n";
    return 1;
  }
  const auto key = model::MakeKey(*type, key_args == 2 ? args[1] : std::string());

  try {
    auto config = config::ConfigLoader::LoadFromYaml(config_path);
    observability::InitializeLogging(config);

    auto  runtime = factory::Build(config);
    auto& manager = *runtime.manager;

    // ------------------------------------------------------------

    if (cmd == "get") {
      if (args.size() >= 3) {
        auto version = ParseNumber(args[2]);
        if (!version) {
          Usage();
          return 1;
        }
        std::cout << ToJson(manager.GetEntityAtVersion(key, *version)) << "\n";
      } else {
        std::cout << ToJson(manager.GetEntity(key)) << "\n";
      }
      return 0;
    }

    if (cmd == "at") {
      auto at_ms = args.size() >= 3 ? ParseNumber(args[2]) : std::nullopt;
      if (!at_ms) {
        Usage();
        return 1;
      }
      std::cout << ToJson(manager.GetEntityAtTime(key, *at_ms)) << "\n";
      return 0;
    }

    if (cmd == "history") {
      PrintList(manager.GetHistory(key));
      return 0;
    }

    if (cmd == "events") {
      PrintList(manager.GetEvents(key));
      return 0;
    }

    if (cmd == "put") {
      if (args.size() < 3) {
        Usage();
        return 1;
      }
      const auto fields = store::PayloadFromJson(args[2]);
      const auto actor  = args.size() >= 4 ? args[3] : std::string("statectl");

      auto result = manager.RunWithRetry(
          txn::Mode::kOptimistic,
          [&](txn::Transaction& txn) {
            return txn.StageWrite(key, [&fields](google::protobuf::Struct& payload) {
              for (const auto& [name, value] : fields.fields()) {
                (*payload.mutable_fields())[name] = value;
              }
            });
          },
          {}, actor);
      if (!result.status.ok()) return Failed(result.status);

      std::cout << ToJson(manager.GetEntityAtVersion(key, result.committed.front().second)) << "\n";
      return 0;
    }

    if (cmd == "delete") {
      const auto actor  = args.size() >= 3 ? args[2] : std::string("statectl");
      auto       result = manager.RunWithRetry(
          txn::Mode::kOptimistic, [&](txn::Transaction& txn) { return txn.StageDelete(key, "statectl delete"); }, {}, actor);
      if (!result.status.ok()) return Failed(result.status);

      std::cout << ToJson(manager.GetEntityAtVersion(key, result.committed.front().second)) << "\n";
      return 0;
    }

    if (cmd == "rollback") {
      if (args.size() < 4) {
        Usage();
        return 1;
      }
      const auto& raw   = args[2];
      const bool  timed = !raw.empty() && raw[0] == '@';
      auto        value = ParseNumber(timed ? raw.substr(1) : raw);
      if (!value) {
        Usage();
        return 1;
      }
      const auto target = timed ? rollback::RollbackTarget::AtTime(*value) : rollback::RollbackTarget::Version(*value);
      const auto actor  = args.size() >= 5 ? args[4] : std::string("statectl");

      auto result = manager.RollbackTo(key, target, args[3], actor);
      if (!result.status.ok()) return Failed(result.status);

      std::cout << ToJson(manager.GetEntityAtVersion(key, result.new_version)) << "\n";
      return 0;
    }

    if (cmd == "list") {
      db::Pagination page;
      if (args.size() >= 2) {
        auto limit = ParseNumber(args[1]);
        if (!limit) {
          Usage();
          return 1;
        }
        page.limit = *limit;
      }
      if (args.size() >= 3) {
        auto offset = ParseNumber(args[2]);
        if (!offset) {
          Usage();
          return 1;
        }
        page.offset = *offset;
      }
      PrintList(manager.ListEntities(*type, page));
      return 0;
    }

    Usage();
    return 1;
  } catch (const util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    STATECORE_LOG_ERROR("statectl failed", {observability::StringField("command", cmd), observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    return 2;
  }
}
