// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.

#ifndef STORAGE_LISTCACHE_INCLUDE_SPD_LOGGER_H_
#define STORAGE_LISTCACHE_INCLUDE_SPD_LOGGER_H_

#include <memory>

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"

namespace listcache {

// Process-wide console logger shared by every cache instance that was not
// given its own Options::info_log.
class SpdLogger {
 public:
  static std::shared_ptr<spdlog::logger>& Log() {
    static std::shared_ptr<spdlog::logger> console_logger = Create();
    return console_logger;
  }

 private:
  static std::shared_ptr<spdlog::logger> Create() {
    std::shared_ptr<spdlog::logger> logger = spdlog::get("listcache");
    if (logger == nullptr) {
      logger = spdlog::stdout_color_mt("listcache");
    }
    logger->set_pattern("%m-%d %H:%M:%S.%e %s:%# %! [%t] %v");
    logger->set_level(spdlog::level::info);
    return logger;
  }
};

}  // namespace listcache

#endif  // STORAGE_LISTCACHE_INCLUDE_SPD_LOGGER_H_
