// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.
//
// CachedObject is the one capability the cache needs from the objects it
// holds.  The objects themselves (mutable lists backed by a slower store)
// are owned and flushed elsewhere; the cache only keeps a shared reference
// and asks for permission before it drops that reference on eviction.

#ifndef STORAGE_LISTCACHE_INCLUDE_CACHED_OBJECT_H_
#define STORAGE_LISTCACHE_INCLUDE_CACHED_OBJECT_H_

#include "listcache/export.h"

namespace listcache {

class LISTCACHE_EXPORT CachedObject {
 public:
  CachedObject() = default;

  CachedObject(const CachedObject&) = delete;
  CachedObject& operator=(const CachedObject&) = delete;

  virtual ~CachedObject();

  // Atomically mark this object for deletion.  Succeeds only when the
  // object has no pending unflushed mutations.  Once it returns true the
  // mark is irrevocable.
  //
  // A false return must leave the object unchanged; the cache will ask
  // again on a later eviction pass.
  //
  // Called with the owning shard's lock held, so it must not call back
  // into the cache.
  virtual bool SetForDeletion() = 0;
};

}  // namespace listcache

#endif  // STORAGE_LISTCACHE_INCLUDE_CACHED_OBJECT_H_
