// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.

#include "util/testutil.h"

#include <cstdio>

#include "listcache/cache.h"

namespace listcache {
namespace test {

std::vector<std::string> KeysInShard(int s, int n) {
  std::vector<std::string> keys;
  char buf[32];
  for (int i = 0; static_cast<int>(keys.size()) < n; i++) {
    std::snprintf(buf, sizeof(buf), "key%06d", i);
    if (Cache::ShardOf(buf) == s) {
      keys.push_back(buf);
    }
  }
  return keys;
}

std::string KeyOutsideShard(int s) {
  char buf[32];
  for (int i = 0;; i++) {
    std::snprintf(buf, sizeof(buf), "other%06d", i);
    if (Cache::ShardOf(buf) != s) {
      return buf;
    }
  }
}

}  // namespace test
}  // namespace listcache
