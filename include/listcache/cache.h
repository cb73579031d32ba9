// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.
//
// A Cache maps string keys to shared CachedObjects.  It has internal
// synchronization and may be safely accessed concurrently from multiple
// threads.
//
// The keyspace is split across a fixed number of shards, each with its own
// lock and its own least-recently-used list.  A key always lands in the
// same shard.  Entries are not evicted on insert; a background thread visits
// one shard per tick and trims it towards Options::max_entries_per_shard,
// skipping every object whose SetForDeletion() refuses.

#ifndef STORAGE_LISTCACHE_INCLUDE_CACHE_H_
#define STORAGE_LISTCACHE_INCLUDE_CACHE_H_

#include <cstdint>
#include <memory>

#include "listcache/cached_object.h"
#include "listcache/export.h"
#include "listcache/options.h"
#include "listcache/slice.h"
#include "listcache/status.h"

namespace listcache {

class LISTCACHE_EXPORT Cache;

// Number of shards in every cache.  Fixed for the lifetime of the process.
static const int kNumShards = 64;

// Largest accepted eviction_interval_micros and eviction_budget_micros
// (one day).
static const uint64_t kMaxEvictionMicros = 24ull * 3600 * 1000 * 1000;

// Create a new sharded LRU cache configured by "options" and start its
// background eviction.  Stores a pointer to the cache in *result and returns
// OK on success.  Stores nullptr in *result and returns a non-OK status on
// error.  The caller should delete *result when it is no longer needed;
// deleting it stops the eviction thread.
LISTCACHE_EXPORT Status NewListCache(const Options& options, Cache** result);

class LISTCACHE_EXPORT Cache {
 public:
  Cache() = default;

  Cache(const Cache&) = delete;
  Cache& operator=(const Cache&) = delete;

  // Drops the cache's references to every resident object.  Objects still
  // referenced by callers stay alive.
  virtual ~Cache();

  // If "key" is resident, make it the most recently used entry of its shard
  // and return the stored object; "candidate" is not stored and the caller
  // keeps the only cache-side reference to it.  Otherwise store "candidate"
  // as the most recently used entry and return it.  A null "candidate"
  // never creates an entry: the call then behaves like Get().
  virtual std::shared_ptr<CachedObject> GetOrInsert(
      const Slice& key, std::shared_ptr<CachedObject> candidate) = 0;

  // If the cache has no mapping for "key", returns nullptr.
  // Else makes it the most recently used entry and returns the object.
  virtual std::shared_ptr<CachedObject> Get(const Slice& key) = 0;

  // Remove the mapping for "key" if there is one.  Unlike eviction this
  // does not consult SetForDeletion(); coordinating with the object's
  // pending mutations is the caller's job.
  virtual void Delete(const Slice& key) = 0;

  // Return the index of the shard "key" is routed to, in [0, kNumShards).
  static int ShardOf(const Slice& key);
};

}  // namespace listcache

#endif  // STORAGE_LISTCACHE_INCLUDE_CACHE_H_
