#include "factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/lock/lock_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/rollback/rollback_coordinator.hpp"
#include "internal/store/event_log.hpp"
#include "internal/store/version_store.hpp"
#include "internal/txn/transaction_manager.hpp"
#include "internal/util/time.hpp"
#if STATECORE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif
#if STATECORE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif
#if STATECORE_CACHE_REDIS
#include "internal/cache/redis_shared_cache.hpp"
#endif

namespace statecore::factory {

using statecore::runtime::config::RuntimeConfig;
using observability::StringField;

namespace {

constexpr std::chrono::milliseconds kDefaultCommitTimeout{5000};

std::chrono::milliseconds CommitTimeout(const RuntimeConfig& config) {
  return util::DurationOr(config.concurrency().commit_timeout(), kDefaultCommitTimeout);
}

lock::AcquireOptions LockDefaults(const RuntimeConfig& config) {
  lock::AcquireOptions defaults;
  defaults.timeout = util::DurationOr(config.concurrency().default_lock_timeout(), defaults.timeout);
  defaults.lease   = util::DurationOr(config.concurrency().lock_lease(), defaults.lease);
  return defaults;
}

} // namespace

Runtime::~Runtime() {
  if (reconciler) reconciler->Stop();
  if (publisher) publisher->Stop();
}

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();

  if (database.has_sqlite()) {
#if STATECORE_DB_SQLITE
    const auto path = database.sqlite().path().empty() ? std::string("state-core.db") : database.sqlite().path();
    auto       pool = std::make_shared<db::sqlite::SqlitePool>(path, CommitTimeout(config));
    {
      auto conn = pool->Acquire();
      db::sqlite::BootstrapSchema(*conn);
    }
    STATECORE_LOG_INFO("using sqlite backend", {StringField("path", path)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(pool));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if STATECORE_DB_POSTGRES
    const auto& pg   = database.postgres();
    auto        pool = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), pg.max_connections() == 0 ? 16 : pg.max_connections());
    db::postgres::BootstrapSchema(pool);
    STATECORE_LOG_INFO("using postgres backend");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool), CommitTimeout(config));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  STATECORE_LOG_INFO("using in-memory backend");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<cache::SharedCacheTier> BuildSharedCache(const RuntimeConfig& config) {
  const auto& l2 = config.cache().l2();
  if (l2.disabled()) return nullptr;

  if (l2.has_redis()) {
#if STATECORE_CACHE_REDIS
    const auto prefix = l2.redis().key_prefix().empty() ? std::string("statecore:") : l2.redis().key_prefix();
    return std::make_shared<cache::RedisSharedCache>(l2.redis().uri(), prefix);
#else
    throw std::runtime_error("redis cache tier requested but not enabled at build time");
#endif
  }

  return std::make_shared<cache::MemorySharedCache>();
}

cache::CacheOptions BuildCacheOptions(const RuntimeConfig& config) {
  const auto& cfg     = config.cache();
  auto        options = cache::CacheOptions::WithDefaults();

  options.l1_ttl             = util::DurationOr(cfg.l1().ttl(), options.l1_ttl);
  options.l2_ttl             = util::DurationOr(cfg.l2().ttl(), options.l2_ttl);
  options.reconcile_interval = util::DurationOr(cfg.reconcile_interval(), options.reconcile_interval);
  if (cfg.l1().max_entries() > 0) options.l1_max_entries = cfg.l1().max_entries();

  for (const auto& override_ttl : cfg.type_ttls()) {
    if (override_ttl.has_l1_ttl()) {
      options.l1_type_ttl[override_ttl.entity_type()] = util::DurationOr(override_ttl.l1_ttl(), options.l1_ttl);
    }
    if (override_ttl.has_l2_ttl()) {
      options.l2_type_ttl[override_ttl.entity_type()] = util::DurationOr(override_ttl.l2_ttl(), options.l2_ttl);
    }
  }
  return options;
}

cache::DependencyTable BuildDependencies(const RuntimeConfig& config) {
  auto table = cache::DependencyTable::WithDefaults();
  for (const auto& rule : config.cache().dependencies()) {
    table.AddRule({rule.source_type(), rule.field(), rule.target_type()});
  }
  return table;
}

Runtime Build(const RuntimeConfig& config) {
  Runtime runtime;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  runtime.repository = BuildRepository(config);

  auto versions = std::make_shared<store::VersionStore>(runtime.repository);
  auto events   = std::make_shared<store::EventLog>(runtime.repository);

  // ------------------------------------------------------------------
  // Concurrency and transactions
  // ------------------------------------------------------------------
  auto locks        = std::make_shared<lock::LockManager>(LockDefaults(config));
  auto transactions = std::make_shared<txn::TransactionManager>(runtime.repository, versions, events, locks);

  // ------------------------------------------------------------------
  // Commit listeners: cache invalidation first, then the outbound stream
  // ------------------------------------------------------------------
  const auto options = BuildCacheOptions(config);
  runtime.cache      = std::make_shared<cache::CacheManager>(versions, BuildSharedCache(config), BuildDependencies(config), options);
  transactions->AddListener(runtime.cache);

  const auto capacity = config.events().queue_capacity() == 0 ? 10000 : config.events().queue_capacity();
  runtime.publisher   = std::make_shared<events::EventPublisher>(capacity);
  transactions->AddListener(runtime.publisher);

  auto rollback = std::make_shared<rollback::RollbackCoordinator>(transactions, versions, events);

  runtime.manager =
      std::make_shared<core::StateManager>(transactions, versions, events, runtime.cache, std::move(rollback), runtime.publisher, locks);

  // ------------------------------------------------------------------
  // Background workers
  // ------------------------------------------------------------------
  runtime.publisher->Start();
  runtime.reconciler = std::make_unique<cache::Reconciler>(runtime.cache, options.reconcile_interval);
  runtime.reconciler->Start();

  return runtime;
}

} // namespace statecore::factory
