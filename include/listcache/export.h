// Copyright (c) 2017 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.

#ifndef STORAGE_LISTCACHE_INCLUDE_EXPORT_H_
#define STORAGE_LISTCACHE_INCLUDE_EXPORT_H_

#if !defined(LISTCACHE_EXPORT)

#if defined(LISTCACHE_SHARED_LIBRARY)
#if defined(LISTCACHE_COMPILE_LIBRARY)
#define LISTCACHE_EXPORT __attribute__((visibility("default")))
#else
#define LISTCACHE_EXPORT
#endif
#else  // defined(LISTCACHE_SHARED_LIBRARY)
#define LISTCACHE_EXPORT
#endif

#endif  // !defined(LISTCACHE_EXPORT)

#endif  // STORAGE_LISTCACHE_INCLUDE_EXPORT_H_
