// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.

#include "util/list_shard.h"

#include <memory>
#include <string>
#include <vector>

#include "listcache/env.h"
#include "util/hash.h"
#include "util/testutil.h"

#include "gtest/gtest.h"

namespace listcache {

using test::TestObject;

static uint32_t HashKey(const std::string& key) {
  return Hash(key.data(), key.size(), 0);
}

class ListShardTest : public testing::Test {
 public:
  // Generous enough that a pass is never cut short by the clock.
  static constexpr uint64_t kBudget = 10 * 1000 * 1000;

  ListShardTest() : env_(Env::Default()) {}

  std::shared_ptr<TestObject> Insert(const std::string& key, int id,
                                     bool busy = false) {
    std::shared_ptr<TestObject> obj = std::make_shared<TestObject>(id, busy);
    shard_.GetOrInsert(key, HashKey(key), obj);
    return obj;
  }

  int Lookup(const std::string& key) {
    std::shared_ptr<CachedObject> v = shard_.Lookup(key, HashKey(key));
    return v == nullptr ? -1 : static_cast<TestObject*>(v.get())->id();
  }

  void Erase(const std::string& key) { shard_.Erase(key, HashKey(key)); }

  EvictionResult Evict() { return shard_.Evict(env_, kBudget); }

  std::vector<std::string> Order() const { return shard_.KeysByRecency(); }

  Env* env_;
  ListShard shard_;
};

TEST_F(ListShardTest, HitAndMiss) {
  ASSERT_EQ(-1, Lookup("a"));

  Insert("a", 1);
  ASSERT_EQ(1, Lookup("a"));
  ASSERT_EQ(-1, Lookup("b"));

  Insert("b", 2);
  ASSERT_EQ(1, Lookup("a"));
  ASSERT_EQ(2, Lookup("b"));
  ASSERT_EQ(2, shard_.Length());
}

TEST_F(ListShardTest, GetOrInsertKeepsFirstValue) {
  std::shared_ptr<TestObject> first = Insert("a", 1);
  std::shared_ptr<CachedObject> candidate = std::make_shared<TestObject>(2);

  std::shared_ptr<CachedObject> got =
      shard_.GetOrInsert("a", HashKey("a"), candidate);
  ASSERT_EQ(first.get(), got.get());
  ASSERT_EQ(1, shard_.Length());
  // The losing candidate is not retained by the shard.
  ASSERT_EQ(1, candidate.use_count());
}

TEST_F(ListShardTest, NullCandidateIsNotStored) {
  shard_.SetCapacity(1);
  ASSERT_TRUE(shard_.GetOrInsert("a", HashKey("a"), nullptr) == nullptr);
  ASSERT_EQ(0, shard_.Length());
  ASSERT_EQ(-1, Lookup("a"));

  std::shared_ptr<TestObject> b = Insert("b", 2);
  Insert("c", 3);
  ASSERT_EQ(2, static_cast<TestObject*>(
                   shard_.GetOrInsert("b", HashKey("b"), nullptr).get())
                   ->id());
  ASSERT_EQ((std::vector<std::string>{"b", "c"}), Order());

  EvictionResult r = Evict();
  ASSERT_EQ(1, r.evicted);
  ASSERT_EQ((std::vector<std::string>{"b"}), Order());
}

TEST_F(ListShardTest, RecencyOrder) {
  Insert("a", 1);
  Insert("b", 2);
  Insert("c", 3);
  ASSERT_EQ((std::vector<std::string>{"c", "b", "a"}), Order());

  ASSERT_EQ(1, Lookup("a"));
  ASSERT_EQ((std::vector<std::string>{"a", "c", "b"}), Order());

  Insert("b", 20);
  ASSERT_EQ((std::vector<std::string>{"b", "a", "c"}), Order());
  ASSERT_EQ(2, Lookup("b"));

  // A miss leaves the order alone.
  ASSERT_EQ(-1, Lookup("zz"));
  ASSERT_EQ((std::vector<std::string>{"b", "a", "c"}), Order());
}

TEST_F(ListShardTest, Erase) {
  Erase("missing");
  ASSERT_EQ(0, shard_.Length());

  std::shared_ptr<TestObject> a = Insert("a", 1, /*busy=*/true);
  Insert("b", 2);
  Erase("a");
  ASSERT_EQ(-1, Lookup("a"));
  ASSERT_EQ(2, Lookup("b"));
  ASSERT_EQ(1, shard_.Length());
  ASSERT_EQ((std::vector<std::string>{"b"}), Order());
  // Erase does not ask for permission, and drops the shard's reference.
  ASSERT_EQ(0, a->asked());
  ASSERT_EQ(1, a.use_count());

  Erase("a");
  ASSERT_EQ(1, shard_.Length());
}

TEST_F(ListShardTest, SlotsAreReused) {
  for (int round = 0; round < 3; round++) {
    for (int i = 0; i < 100; i++) {
      Insert("k" + std::to_string(i), i);
    }
    ASSERT_EQ(100, shard_.Length());
    for (int i = 0; i < 100; i++) {
      ASSERT_EQ(i, Lookup("k" + std::to_string(i)));
    }
    for (int i = 0; i < 100; i++) {
      Erase("k" + std::to_string(i));
    }
    ASSERT_EQ(0, shard_.Length());
    ASSERT_TRUE(Order().empty());
  }
}

TEST_F(ListShardTest, EvictsLeastRecentlyUsed) {
  shard_.SetCapacity(2);
  Insert("a", 1);
  Insert("b", 2);
  Insert("c", 3);
  ASSERT_EQ(3, shard_.Length());

  EvictionResult r = Evict();
  ASSERT_EQ(1, r.evicted);
  ASSERT_EQ(0, r.skipped);
  ASSERT_EQ(2, r.remaining);
  ASSERT_EQ(-1, Lookup("a"));
  ASSERT_EQ((std::vector<std::string>{"c", "b"}), Order());
}

TEST_F(ListShardTest, PromotedEntrySurvives) {
  shard_.SetCapacity(2);
  Insert("a", 1);
  Insert("b", 2);
  ASSERT_EQ(1, Lookup("a"));
  Insert("c", 3);
  ASSERT_EQ((std::vector<std::string>{"c", "a", "b"}), Order());

  Evict();
  ASSERT_EQ((std::vector<std::string>{"c", "a"}), Order());
  ASSERT_EQ(-1, Lookup("b"));
}

TEST_F(ListShardTest, LookupBeforeLaterInsertsStillAges) {
  shard_.SetCapacity(2);
  Insert("a", 1);
  ASSERT_EQ(1, Lookup("a"));
  Insert("b", 2);
  Insert("c", 3);
  ASSERT_EQ((std::vector<std::string>{"c", "b", "a"}), Order());

  Evict();
  ASSERT_EQ((std::vector<std::string>{"c", "b"}), Order());
}

TEST_F(ListShardTest, BusyObjectsAreNeverEvicted) {
  shard_.SetCapacity(1);
  std::shared_ptr<TestObject> a = Insert("a", 1, /*busy=*/true);
  std::shared_ptr<TestObject> b = Insert("b", 2, /*busy=*/true);

  for (int i = 0; i < 50; i++) {
    EvictionResult r = Evict();
    ASSERT_EQ(0, r.evicted);
    ASSERT_EQ(2, r.skipped);
  }
  ASSERT_EQ(1, Lookup("a"));
  ASSERT_EQ(2, Lookup("b"));
  ASSERT_FALSE(a->marked());
  ASSERT_FALSE(b->marked());
}

TEST_F(ListShardTest, SkipsBusyTailWithoutReordering) {
  shard_.SetCapacity(2);
  std::shared_ptr<TestObject> a = Insert("a", 1, /*busy=*/true);
  std::shared_ptr<TestObject> b = Insert("b", 2);
  Insert("c", 3);
  Insert("d", 4);

  EvictionResult r = Evict();
  ASSERT_EQ(2, r.evicted);
  ASSERT_EQ(1, r.skipped);
  ASSERT_TRUE(b->marked());
  ASSERT_FALSE(a->marked());
  // "a" keeps its place at the cold end.
  ASSERT_EQ((std::vector<std::string>{"d", "a"}), Order());

  // Once its mutations are flushed it goes on the next pass.
  a->SetBusy(false);
  Insert("e", 5);
  Evict();
  ASSERT_EQ((std::vector<std::string>{"e", "d"}), Order());
  ASSERT_TRUE(a->marked());
}

TEST_F(ListShardTest, EvictedObjectOutlivesShard) {
  shard_.SetCapacity(1);
  std::shared_ptr<TestObject> a = Insert("a", 1);
  Insert("b", 2);
  ASSERT_EQ(2, a.use_count());

  Evict();
  ASSERT_TRUE(a->marked());
  ASSERT_EQ(1, a.use_count());
  ASSERT_EQ(1, a->id());
}

TEST_F(ListShardTest, UnlimitedShardNeverShrinks) {
  shard_.SetCapacity(0);
  for (int i = 0; i < 5000; i++) {
    Insert("k" + std::to_string(i), i);
  }
  for (int i = 0; i < 10; i++) {
    EvictionResult r = Evict();
    ASSERT_EQ(0, r.evicted);
    ASSERT_EQ(5000, r.remaining);
  }
  ASSERT_EQ(5000, shard_.Length());
}

TEST_F(ListShardTest, ConvergesToCapacity) {
  const int kCapacity = 10;
  shard_.SetCapacity(kCapacity);
  std::vector<std::shared_ptr<TestObject>> objs;
  for (int i = 0; i < 1000; i++) {
    objs.push_back(Insert("k" + std::to_string(i), i));
  }
  for (int pass = 0; pass < 1000 && shard_.Length() > kCapacity; pass++) {
    Evict();
  }
  ASSERT_EQ(kCapacity, shard_.Length());
  // The survivors are the newest entries.
  for (int i = 1000 - kCapacity; i < 1000; i++) {
    ASSERT_EQ(i, Lookup("k" + std::to_string(i)));
    ASSERT_FALSE(objs[i]->marked());
  }
}

TEST_F(ListShardTest, EmptyShardOverCapacityCheckIsHarmless) {
  shard_.SetCapacity(3);
  EvictionResult r = Evict();
  ASSERT_EQ(0, r.evicted);
  ASSERT_EQ(0, r.remaining);
}

TEST_F(ListShardTest, PassStopsAtDeadline) {
  shard_.SetCapacity(1);
  for (int i = 0; i < 100; i++) {
    Insert("k" + std::to_string(i), i);
  }

  // Every clock read advances one micro, so a 4 micro budget leaves time
  // for exactly three candidates.
  test::SteppingClockEnv clock(Env::Default(), 1);
  EvictionResult r = shard_.Evict(&clock, 4);
  ASSERT_EQ(3, r.evicted);
  ASSERT_EQ(97, shard_.Length());
  ASSERT_EQ(-1, Lookup("k0"));
  ASSERT_EQ(-1, Lookup("k2"));
  ASSERT_EQ(3, Lookup("k3"));

  // A clock that jumps past the deadline on its first read evicts nothing.
  test::SteppingClockEnv slow(Env::Default(), 1000);
  r = shard_.Evict(&slow, 10);
  ASSERT_EQ(0, r.evicted);
  ASSERT_EQ(97, shard_.Length());
}

}  // namespace listcache
