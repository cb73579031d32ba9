// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.

#include "util/list_shard.h"

#include <cassert>
#include <utility>

#include "listcache/env.h"
#include "util/mutexlock.h"

namespace listcache {

// We provide our own simple hash table: chaining through the arena avoids a
// node allocation per entry, and the table is resized to keep the average
// chain length at or below one.
SlotTable::SlotTable(std::vector<ListNode>* nodes)
    : nodes_(nodes), elems_(0), buckets_(4, kHeadSlot) {}

uint32_t SlotTable::Lookup(const Slice& key, uint32_t hash) const {
  uint32_t slot = buckets_[hash & (buckets_.size() - 1)];
  while (slot != kHeadSlot) {
    const ListNode& node = (*nodes_)[slot];
    if (node.hash == hash && key == Slice(node.key)) {
      break;
    }
    slot = node.next_hash;
  }
  return slot;
}

void SlotTable::Insert(uint32_t slot) {
  ListNode& node = (*nodes_)[slot];
  uint32_t* ptr = FindPointer(node.key, node.hash);
  assert(*ptr == kHeadSlot);
  node.next_hash = kHeadSlot;
  *ptr = slot;
  ++elems_;
  if (elems_ > buckets_.size()) {
    // Since each cache entry is fairly large, we aim for a small
    // average linked list length (<= 1).
    Resize();
  }
}

uint32_t SlotTable::Remove(const Slice& key, uint32_t hash) {
  uint32_t* ptr = FindPointer(key, hash);
  uint32_t result = *ptr;
  if (result != kHeadSlot) {
    *ptr = (*nodes_)[result].next_hash;
    --elems_;
  }
  return result;
}

uint32_t* SlotTable::FindPointer(const Slice& key, uint32_t hash) {
  uint32_t* ptr = &buckets_[hash & (buckets_.size() - 1)];
  while (*ptr != kHeadSlot && ((*nodes_)[*ptr].hash != hash ||
                               key != Slice((*nodes_)[*ptr].key))) {
    ptr = &(*nodes_)[*ptr].next_hash;
  }
  return ptr;
}

void SlotTable::Resize() {
  size_t new_length = 4;
  while (new_length < elems_) {
    new_length *= 2;
  }
  std::vector<uint32_t> new_buckets(new_length, kHeadSlot);
  uint32_t count = 0;
  for (size_t i = 0; i < buckets_.size(); i++) {
    uint32_t slot = buckets_[i];
    while (slot != kHeadSlot) {
      ListNode& node = (*nodes_)[slot];
      uint32_t next = node.next_hash;
      uint32_t* ptr = &new_buckets[node.hash & (new_length - 1)];
      node.next_hash = *ptr;
      *ptr = slot;
      slot = next;
      count++;
    }
  }
  assert(elems_ == count);
  buckets_.swap(new_buckets);
}

ListShard::ListShard() : capacity_(0), usage_(0), table_(&nodes_) {
  // Make empty circular linked list.
  nodes_.resize(1);
  ListNode& head = nodes_[kHeadSlot];
  head.hash = 0;
  head.next_hash = kHeadSlot;
  head.next = kHeadSlot;
  head.prev = kHeadSlot;
}

ListShard::~ListShard() {
  // Dropping the arena releases the cache's reference on every object.
  assert(usage_ == table_.size());
}

void ListShard::List_Remove(uint32_t slot) {
  ListNode& e = nodes_[slot];
  nodes_[e.next].prev = e.prev;
  nodes_[e.prev].next = e.next;
}

void ListShard::List_PushFront(uint32_t slot) {
  // Make "slot" the newest entry by inserting it just after the head.
  ListNode& head = nodes_[kHeadSlot];
  ListNode& e = nodes_[slot];
  e.prev = kHeadSlot;
  e.next = head.next;
  nodes_[e.next].prev = slot;
  head.next = slot;
}

uint32_t ListShard::AllocateSlot() {
  if (!free_slots_.empty()) {
    uint32_t slot = free_slots_.back();
    free_slots_.pop_back();
    return slot;
  }
  nodes_.emplace_back();
  return static_cast<uint32_t>(nodes_.size() - 1);
}

void ListShard::FinishErase(uint32_t slot) {
  assert(slot != kHeadSlot);
  List_Remove(slot);
  ListNode& e = nodes_[slot];
  e.key.clear();
  e.value.reset();
  e.next = e.prev = e.next_hash = kHeadSlot;
  free_slots_.push_back(slot);
  --usage_;
}

std::shared_ptr<CachedObject> ListShard::GetOrInsert(
    const Slice& key, uint32_t hash, std::shared_ptr<CachedObject> candidate) {
  MutexLock l(&mutex_);
  uint32_t slot = table_.Lookup(key, hash);
  if (slot != kHeadSlot) {
    // Already resident: the stored object wins, the candidate is dropped.
    List_Remove(slot);
    List_PushFront(slot);
    return nodes_[slot].value;
  }
  if (candidate == nullptr) {
    // Every stored value must be able to answer SetForDeletion().
    return nullptr;
  }

  slot = AllocateSlot();
  ListNode& e = nodes_[slot];
  e.key.assign(key.data(), key.size());
  e.value = std::move(candidate);
  e.hash = hash;
  List_PushFront(slot);
  table_.Insert(slot);
  ++usage_;
  return nodes_[slot].value;
}

std::shared_ptr<CachedObject> ListShard::Lookup(const Slice& key,
                                                uint32_t hash) {
  MutexLock l(&mutex_);
  uint32_t slot = table_.Lookup(key, hash);
  if (slot == kHeadSlot) {
    return nullptr;
  }
  List_Remove(slot);
  List_PushFront(slot);
  return nodes_[slot].value;
}

void ListShard::Erase(const Slice& key, uint32_t hash) {
  MutexLock l(&mutex_);
  uint32_t slot = table_.Remove(key, hash);
  if (slot != kHeadSlot) {
    FinishErase(slot);
  }
}

EvictionResult ListShard::Evict(Env* env, uint64_t budget_micros) {
  MutexLock l(&mutex_);
  EvictionResult result;
  const uint64_t start = env->NowMicros();
  if (capacity_ > 0) {
    const uint64_t deadline = start + budget_micros;
    uint32_t e = nodes_[kHeadSlot].prev;
    while (usage_ > capacity_ && env->NowMicros() < deadline) {
      if (e == kHeadSlot) {
        // Empty, or every remaining entry refused.
        break;
      }
      ListNode& node = nodes_[e];
      if (!node.value->SetForDeletion()) {
        // Pending mutations: leave it where it is and try the next
        // coldest entry.
        result.skipped++;
        e = node.prev;
        continue;
      }

      // The object is now marked for deletion and can be dropped.
      const uint32_t prev = node.prev;
      const uint32_t removed = table_.Remove(node.key, node.hash);
      assert(removed == e);
      (void)removed;
      FinishErase(e);
      result.evicted++;
      e = prev;
    }
  }
  result.remaining = usage_;
  result.held_micros = env->NowMicros() - start;
  return result;
}

size_t ListShard::Length() const {
  MutexLock l(&mutex_);
  return usage_;
}

std::vector<std::string> ListShard::KeysByRecency() const {
  MutexLock l(&mutex_);
  std::vector<std::string> keys;
  keys.reserve(usage_);
  for (uint32_t e = nodes_[kHeadSlot].next; e != kHeadSlot;
       e = nodes_[e].next) {
    keys.push_back(nodes_[e].key);
  }
  return keys;
}

}  // namespace listcache
