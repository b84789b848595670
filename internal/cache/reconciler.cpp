#include "reconciler.hpp"

#include "internal/observability/logging.hpp"

namespace statecore::cache {

Reconciler::Reconciler(std::shared_ptr<CacheManager> cache, std::chrono::milliseconds interval)
    : cache_(std::move(cache)), interval_(interval) {
}

Reconciler::~Reconciler() {
  Stop();
}

void Reconciler::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&Reconciler::Loop, this);
}

void Reconciler::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void Reconciler::Loop() {
  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, interval_, [this] { return !running_; })) break;

    lock.unlock();
    try {
      cache_->ReconcileOnce();
    } catch (const std::exception& e) {
      STATECORE_LOG_WARN("cache reconciliation sweep failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace statecore::cache
