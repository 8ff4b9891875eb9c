/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace fcp::common {
  namespace {
    constexpr auto kPattern{"[%Y-%m-%d %H:%M:%S.%e][th:%t][%l][%n] %v"};

    void setGlobalPattern(spdlog::logger &logger) {
      logger.set_pattern(kPattern);
    }

    Logger createLoggerImpl(const std::string &tag) {
      auto logger = spdlog::stdout_color_mt(tag);
      setGlobalPattern(*logger);
      return logger;
    }
  }  // namespace

  Logger createLogger(const std::string &tag) {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    auto logger = spdlog::get(tag);
    if (logger == nullptr) {
      logger = createLoggerImpl(tag);
    }
    return logger;
  }
}  // namespace fcp::common
