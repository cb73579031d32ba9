// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.

#include "listcache/cache.h"

#include <utility>

#include "listcache/spd_logger.h"

#include "util/cache_impl.h"
#include "util/hash.h"
#include "util/mutexlock.h"

namespace listcache {

CachedObject::~CachedObject() = default;

Cache::~Cache() {}

namespace {

inline uint32_t HashSlice(const Slice& s) {
  return Hash(s.data(), s.size(), 0);
}

inline int Shard(uint32_t hash) { return static_cast<int>(hash % kNumShards); }

}  // namespace

int Cache::ShardOf(const Slice& key) { return Shard(HashSlice(key)); }

ShardedListCache::ShardedListCache(const Options& options)
    : env_(options.env),
      info_log_(options.info_log != nullptr ? options.info_log
                                            : SpdLogger::Log()),
      eviction_interval_micros_(options.eviction_interval_micros),
      eviction_budget_micros_(options.eviction_budget_micros),
      shutting_down_(false),
      passes_run_(0),
      background_cv_(&mutex_),
      eviction_started_(false),
      eviction_exited_(false) {
  for (int s = 0; s < kNumShards; s++) {
    shard_[s].SetCapacity(options.max_entries_per_shard);
  }
  SPDLOG_LOGGER_INFO(info_log_, "create ShardedListCache, {} shards of {}",
                     kNumShards, options.max_entries_per_shard);
}

ShardedListCache::~ShardedListCache() {
  // Wait for the eviction thread to notice the flag and leave.
  mutex_.Lock();
  shutting_down_.store(true, std::memory_order_release);
  background_cv_.SignalAll();
  while (eviction_started_ && !eviction_exited_) {
    background_cv_.Wait();
  }
  mutex_.Unlock();
  SPDLOG_LOGGER_INFO(info_log_, "ShardedListCache stopped after {} passes",
                     passes_run_.load(std::memory_order_relaxed));
}

std::shared_ptr<CachedObject> ShardedListCache::GetOrInsert(
    const Slice& key, std::shared_ptr<CachedObject> candidate) {
  const uint32_t hash = HashSlice(key);
  return shard_[Shard(hash)].GetOrInsert(key, hash, std::move(candidate));
}

std::shared_ptr<CachedObject> ShardedListCache::Get(const Slice& key) {
  const uint32_t hash = HashSlice(key);
  return shard_[Shard(hash)].Lookup(key, hash);
}

void ShardedListCache::Delete(const Slice& key) {
  const uint32_t hash = HashSlice(key);
  shard_[Shard(hash)].Erase(key, hash);
}

void ShardedListCache::StartEviction() {
  MutexLock l(&mutex_);
  if (eviction_started_) {
    return;
  }
  eviction_started_ = true;
  env_->StartThread(&ShardedListCache::BGEvictionEntryPoint, this);
  SPDLOG_LOGGER_INFO(info_log_, "eviction started, one shard every {}us",
                     eviction_interval_micros_);
}

void ShardedListCache::BGEvictionEntryPoint(void* cache) {
  reinterpret_cast<ShardedListCache*>(cache)->BackgroundEvictionLoop();
}

void ShardedListCache::BackgroundEvictionLoop() {
  int s = 0;
  mutex_.Lock();
  uint64_t tick = env_->NowMicros() + eviction_interval_micros_;
  while (!shutting_down_.load(std::memory_order_acquire)) {
    // Sleep until the next tick.  The destructor signals to cut it short.
    while (!shutting_down_.load(std::memory_order_acquire)) {
      const uint64_t now = env_->NowMicros();
      if (now >= tick) {
        break;
      }
      background_cv_.WaitFor(tick - now);
    }
    if (shutting_down_.load(std::memory_order_acquire)) {
      break;
    }

    mutex_.Unlock();
    RemoveOldest(s);
    passes_run_.fetch_add(1, std::memory_order_release);
    mutex_.Lock();

    tick = NextEvictionTick(tick, env_->NowMicros(), eviction_interval_micros_);
    s = (s + 1) % kNumShards;
  }
  eviction_exited_ = true;
  background_cv_.SignalAll();
  mutex_.Unlock();
}

uint64_t ShardedListCache::NextEvictionTick(uint64_t tick, uint64_t now,
                                            uint64_t interval) {
  tick += interval;
  if (now > tick) {
    // The pass overran whole ticks.  Drop the missed ones but keep the phase.
    tick += (now - tick + interval - 1) / interval * interval;
  }
  return tick;
}

EvictionResult ShardedListCache::RemoveOldest(int s) {
  EvictionResult r = shard_[s].Evict(env_, eviction_budget_micros_);
  SPDLOG_LOGGER_INFO(info_log_,
                     "lru.removeOldest for {} blocked for: {}us, evicted {} "
                     "skipped {} remaining {}",
                     s, r.held_micros, r.evicted, r.skipped, r.remaining);
  return r;
}

EvictionResult ShardedListCache::TEST_EvictShard(int s) {
  return RemoveOldest(s);
}

Status NewListCache(const Options& options, Cache** result) {
  *result = nullptr;
  if (options.env == nullptr) {
    return Status::InvalidArgument("env must not be null");
  }
  if (options.eviction_interval_micros == 0) {
    return Status::InvalidArgument("eviction_interval_micros",
                                   "must be positive");
  }
  if (options.eviction_interval_micros > kMaxEvictionMicros) {
    return Status::InvalidArgument("eviction_interval_micros",
                                   "must not exceed one day");
  }
  if (options.eviction_budget_micros == 0) {
    return Status::InvalidArgument("eviction_budget_micros",
                                   "must be positive");
  }
  if (options.eviction_budget_micros > kMaxEvictionMicros) {
    return Status::InvalidArgument("eviction_budget_micros",
                                   "must not exceed one day");
  }

  ShardedListCache* cache = new ShardedListCache(options);
  cache->StartEviction();
  *result = cache;
  return Status::OK();
}

}  // namespace listcache
