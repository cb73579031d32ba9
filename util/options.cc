// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.

#include "listcache/options.h"

#include "listcache/env.h"

namespace listcache {

Options::Options() : env(Env::Default()) {}

}  // namespace listcache
