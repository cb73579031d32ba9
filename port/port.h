// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.

#ifndef STORAGE_LISTCACHE_PORT_PORT_H_
#define STORAGE_LISTCACHE_PORT_PORT_H_

// The C++11 standard library port covers every platform listcache builds on.
#include "port/port_stdcxx.h"

#endif  // STORAGE_LISTCACHE_PORT_PORT_H_
