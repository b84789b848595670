#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "cache_manager.hpp"

namespace statecore::cache {

/*
  Runs CacheManager::ReconcileOnce on a fixed interval until stopped.
*/
class Reconciler {
 public:
  Reconciler(std::shared_ptr<CacheManager> cache, std::chrono::milliseconds interval);
  ~Reconciler();

  void Start();
  void Stop();

 private:
  void Loop();

  std::shared_ptr<CacheManager> cache_;
  std::chrono::milliseconds     interval_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
};

} // namespace statecore::cache
