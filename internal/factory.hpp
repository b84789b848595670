#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/cache/cache_manager.hpp"
#include "internal/cache/reconciler.hpp"
#include "internal/core/state_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_publisher.hpp"

namespace statecore::factory {

/*
  Runtime

  Owns every long-lived component. Background workers are declared last
  so they stop before the components they use are destroyed.
*/
struct Runtime {
  std::shared_ptr<db::Repository>       repository;
  std::shared_ptr<cache::CacheManager>  cache;
  std::shared_ptr<core::StateManager>   manager;

  std::shared_ptr<events::EventPublisher> publisher;
  std::unique_ptr<cache::Reconciler>      reconciler;

  Runtime() = default;
  Runtime(Runtime&&) = default;
  Runtime& operator=(Runtime&&) = default;
  ~Runtime();
};

std::shared_ptr<db::Repository> BuildRepository(const statecore::runtime::config::RuntimeConfig& config);

std::shared_ptr<cache::SharedCacheTier> BuildSharedCache(const statecore::runtime::config::RuntimeConfig& config);

cache::CacheOptions   BuildCacheOptions(const statecore::runtime::config::RuntimeConfig& config);
cache::DependencyTable BuildDependencies(const statecore::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: the only place that knows concrete backend types.
  Starts the event dispatch thread and the cache reconciler.
*/
Runtime Build(const statecore::runtime::config::RuntimeConfig& config);

} // namespace statecore::factory
