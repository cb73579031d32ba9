// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.
//
// Simple hash function used to route keys to shards and to bucket them
// inside a shard's index.

#ifndef STORAGE_LISTCACHE_UTIL_HASH_H_
#define STORAGE_LISTCACHE_UTIL_HASH_H_

#include <cstddef>
#include <cstdint>

namespace listcache {

uint32_t Hash(const char* data, size_t n, uint32_t seed);

}  // namespace listcache

#endif  // STORAGE_LISTCACHE_UTIL_HASH_H_
