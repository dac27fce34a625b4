/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>
#include <print>

#include <dlio/log/logger.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>

namespace dlio {
  /**
   * Configure console logging for the `dlio` group.
   */
  inline void simpleLoggingSystem(log::Level level = log::Level::INFO) {
    std::string yaml = R"(
    sinks:
      - name: console
        type: console
        color: true
        capacity: 4
        latency: 0
    groups:
      - name: main
        sink: console
        level: info
        is_fallback: true
        children:
          - name: dlio
    )";
    auto logsys = std::make_shared<soralog::LoggingSystem>(
        std::make_shared<soralog::ConfiguratorFromYAML>(yaml));
    auto r = logsys->configure();
    if (not r.message.empty()) {
      std::println(stderr, "soralog error: {}", r.message);
    }
    if (r.has_error) {
      exit(EXIT_FAILURE);
    }
    log::setLoggingSystem(logsys);
    log::setLevelOfGroup(log::kDefaultGroupName, level);
  }
}  // namespace dlio
