// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.

#ifndef STORAGE_LISTCACHE_INCLUDE_OPTIONS_H_
#define STORAGE_LISTCACHE_INCLUDE_OPTIONS_H_

#include <cstddef>
#include <cstdint>
#include <memory>

#include "listcache/export.h"

namespace spdlog {
class logger;
}  // namespace spdlog

namespace listcache {

class Env;

// Options to control the behavior of a cache (passed to NewListCache).
struct LISTCACHE_EXPORT Options {
  // Create an Options object with default values for all fields.
  Options();

  // Target number of entries held by each of the cache's shards.  The
  // same value applies to every shard.  Shards may run above it until the
  // background eviction reaches them, and stay above it while their cold
  // entries refuse deletion.
  //
  // 0 means unlimited: the shard is never evicted.
  size_t max_entries_per_shard = 0;

  // Use the specified object to read the clock and start the eviction
  // thread.
  // Default: Env::Default()
  Env* env;

  // Eviction records and lifecycle messages are written to info_log if it
  // is non-null, or to the shared console logger if info_log is null.
  std::shared_ptr<spdlog::logger> info_log = nullptr;

  // The eviction thread visits one shard per tick, round robin.  A shard is
  // therefore revisited every (eviction_interval_micros * 64) micros.
  // Ticks keep a fixed rate; a pass that overruns skips the missed ticks.
  // Must be in (0, kMaxEvictionMicros].
  uint64_t eviction_interval_micros = 1000000;

  // Upper bound on how long one eviction pass may hold a shard's lock.
  // Foreground operations on that shard wait at most this long behind it.
  // Must be in (0, kMaxEvictionMicros].
  uint64_t eviction_budget_micros = 10000;
};

}  // namespace listcache

#endif  // STORAGE_LISTCACHE_INCLUDE_OPTIONS_H_
