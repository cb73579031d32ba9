// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.

#ifndef STORAGE_LISTCACHE_UTIL_CACHE_IMPL_H_
#define STORAGE_LISTCACHE_UTIL_CACHE_IMPL_H_

#include <atomic>
#include <cstdint>
#include <memory>

#include "listcache/cache.h"
#include "listcache/env.h"
#include "port/port.h"
#include "port/thread_annotations.h"
#include "util/list_shard.h"

namespace spdlog {
class logger;
}  // namespace spdlog

namespace listcache {

class ShardedListCache : public Cache {
 public:
  // REQUIRES: options have been checked by NewListCache.
  explicit ShardedListCache(const Options& options);
  ~ShardedListCache() override;

  ShardedListCache(const ShardedListCache&) = delete;
  ShardedListCache& operator=(const ShardedListCache&) = delete;

  // Implementations of the Cache interface
  std::shared_ptr<CachedObject> GetOrInsert(
      const Slice& key, std::shared_ptr<CachedObject> candidate) override;
  std::shared_ptr<CachedObject> Get(const Slice& key) override;
  void Delete(const Slice& key) override;

  // Launch the thread that runs one eviction pass per tick.
  void StartEviction();

  // Extra methods (for testing) that are not in the public Cache interface

  // Run one eviction pass over shard "s" right now, on the calling thread.
  EvictionResult TEST_EvictShard(int s);

  const ListShard* TEST_Shard(int s) const { return &shard_[s]; }

  // Return the tick after "tick" on a fixed-rate schedule with period
  // "interval", skipping ticks that already passed by "now".
  static uint64_t NextEvictionTick(uint64_t tick, uint64_t now,
                                   uint64_t interval);

  // Number of passes the eviction thread has completed.
  uint64_t TEST_PassesRun() const {
    return passes_run_.load(std::memory_order_acquire);
  }

 private:
  static void BGEvictionEntryPoint(void* cache);
  void BackgroundEvictionLoop();
  EvictionResult RemoveOldest(int s);

  // Constant after construction
  Env* const env_;
  const std::shared_ptr<spdlog::logger> info_log_;
  const uint64_t eviction_interval_micros_;
  const uint64_t eviction_budget_micros_;

  ListShard shard_[kNumShards];

  std::atomic<bool> shutting_down_;
  std::atomic<uint64_t> passes_run_;

  // Guards the eviction thread's lifecycle, never a shard.
  port::Mutex mutex_;
  port::CondVar background_cv_ GUARDED_BY(mutex_);
  bool eviction_started_ GUARDED_BY(mutex_);
  bool eviction_exited_ GUARDED_BY(mutex_);
};

}  // namespace listcache

#endif  // STORAGE_LISTCACHE_UTIL_CACHE_IMPL_H_
