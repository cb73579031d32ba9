// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.
//
// A single shard of the sharded list cache: one recency list, one key index
// and the mutex that guards both.

#ifndef STORAGE_LISTCACHE_UTIL_LIST_SHARD_H_
#define STORAGE_LISTCACHE_UTIL_LIST_SHARD_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "listcache/cached_object.h"
#include "listcache/slice.h"
#include "port/port.h"
#include "port/thread_annotations.h"

namespace listcache {

class Env;

// Entries live in an arena of slots and link to each other by slot index.
// Slot 0 is the dummy head of the circular recency list and never holds an
// entry, so 0 also terminates hash chains.
static const uint32_t kHeadSlot = 0;

struct ListNode {
  std::string key;
  std::shared_ptr<CachedObject> value;
  uint32_t hash;       // Hash of key; saves rehashing on resize and compare
  uint32_t next_hash;  // Next slot in the same index bucket
  uint32_t next;       // Towards the least recently used end
  uint32_t prev;       // Towards the most recently used end
};

// Index from key to slot.  Buckets are chains of slot indices threaded
// through ListNode::next_hash, so lookups never allocate.
class SlotTable {
 public:
  explicit SlotTable(std::vector<ListNode>* nodes);
  ~SlotTable() = default;

  SlotTable(const SlotTable&) = delete;
  SlotTable& operator=(const SlotTable&) = delete;

  uint32_t Lookup(const Slice& key, uint32_t hash) const;

  // Links "slot" into the table.  REQUIRES: its key is not already present.
  void Insert(uint32_t slot);

  // Unlinks the slot holding "key" and returns it, or kHeadSlot if absent.
  uint32_t Remove(const Slice& key, uint32_t hash);

  size_t size() const { return elems_; }

 private:
  // Return a pointer to the link that refers to the slot matching key/hash.
  // If there is no such slot, return a pointer to the trailing link of the
  // corresponding chain.  The pointer is invalidated by any arena growth.
  uint32_t* FindPointer(const Slice& key, uint32_t hash);
  void Resize();

  std::vector<ListNode>* const nodes_;  // Owned by the shard
  uint32_t elems_;
  std::vector<uint32_t> buckets_;  // Size is always a power of two
};

// Outcome of one eviction pass, reported to the caller for logging.
struct EvictionResult {
  size_t evicted = 0;    // Entries removed after SetForDeletion() agreed
  size_t skipped = 0;    // Candidates that refused and were left in place
  size_t remaining = 0;  // Live entries when the pass ended
  uint64_t held_micros = 0;
};

class ListShard {
 public:
  ListShard();
  ~ListShard();

  ListShard(const ListShard&) = delete;
  ListShard& operator=(const ListShard&) = delete;

  // Separate from constructor so caller can easily make an array of
  // ListShard.  0 means unlimited.
  void SetCapacity(size_t capacity) { capacity_ = capacity; }
  size_t Capacity() const { return capacity_; }

  // Like the Cache methods, but with the key's hash computed by the caller.
  // Never stores a null value.
  std::shared_ptr<CachedObject> GetOrInsert(
      const Slice& key, uint32_t hash,
      std::shared_ptr<CachedObject> candidate);
  std::shared_ptr<CachedObject> Lookup(const Slice& key, uint32_t hash);
  void Erase(const Slice& key, uint32_t hash);

  // Runs one eviction pass while holding the shard's lock, trimming the
  // least recently used entries that agree to be deleted until the shard
  // is within capacity, the scan passes the most recently used entry, or
  // "budget_micros" measured on env's clock have elapsed.
  EvictionResult Evict(Env* env, uint64_t budget_micros);

  size_t Length() const;

  // Keys from most to least recently used.
  std::vector<std::string> KeysByRecency() const;

 private:
  void List_Remove(uint32_t slot) EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  void List_PushFront(uint32_t slot) EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  uint32_t AllocateSlot() EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  // Unlinks an entry already removed from the index and recycles its slot.
  void FinishErase(uint32_t slot) EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  // Initialized before use.
  size_t capacity_;

  // mutex_ protects the following state.
  mutable port::Mutex mutex_;
  size_t usage_ GUARDED_BY(mutex_);

  // nodes_[kHeadSlot].next is the newest entry, .prev is the oldest.
  std::vector<ListNode> nodes_ GUARDED_BY(mutex_);
  std::vector<uint32_t> free_slots_ GUARDED_BY(mutex_);
  SlotTable table_ GUARDED_BY(mutex_);
};

}  // namespace listcache

#endif  // STORAGE_LISTCACHE_UTIL_LIST_SHARD_H_
