// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.

#ifndef STORAGE_LISTCACHE_UTIL_TESTUTIL_H_
#define STORAGE_LISTCACHE_UTIL_TESTUTIL_H_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "listcache/cached_object.h"
#include "listcache/env.h"

namespace listcache {
namespace test {

// A cached object whose pending-mutation state is set by the test.
class TestObject : public CachedObject {
 public:
  explicit TestObject(int id, bool busy = false)
      : id_(id), busy_(busy), marked_(false), asked_(0) {}

  bool SetForDeletion() override {
    asked_.fetch_add(1, std::memory_order_relaxed);
    if (busy_.load(std::memory_order_acquire)) {
      return false;
    }
    marked_.store(true, std::memory_order_release);
    return true;
  }

  int id() const { return id_; }
  void SetBusy(bool busy) { busy_.store(busy, std::memory_order_release); }
  bool marked() const { return marked_.load(std::memory_order_acquire); }
  int asked() const { return asked_.load(std::memory_order_relaxed); }

 private:
  const int id_;
  std::atomic<bool> busy_;
  std::atomic<bool> marked_;
  std::atomic<int> asked_;
};

// Return "n" distinct keys that all route to shard "s".
std::vector<std::string> KeysInShard(int s, int n);

// Return a key that routes to a shard other than "s".
std::string KeyOutsideShard(int s);

// An Env whose clock moves forward by a fixed step on every read, so that
// time-bounded loops run a predictable number of iterations.
class SteppingClockEnv : public EnvWrapper {
 public:
  SteppingClockEnv(Env* base, uint64_t step_micros)
      : EnvWrapper(base), now_(0), step_(step_micros) {}

  uint64_t NowMicros() override {
    return now_.fetch_add(step_, std::memory_order_relaxed);
  }

 private:
  std::atomic<uint64_t> now_;
  const uint64_t step_;
};

}  // namespace test
}  // namespace listcache

#endif  // STORAGE_LISTCACHE_UTIL_TESTUTIL_H_
