/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>

namespace dlio::log {
  using Level = soralog::Level;
  using Logger = std::shared_ptr<soralog::Logger>;

  inline const std::string kDefaultGroupName{"dlio"};

  namespace detail {
    inline std::shared_ptr<soralog::LoggingSystem> logging_system;
  }  // namespace detail

  inline void setLoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system) {
    detail::logging_system = std::move(logging_system);
  }

  inline std::shared_ptr<soralog::LoggingSystem> loggingSystem() {
    if (detail::logging_system == nullptr) {
      throw std::logic_error{
          "dlio logging system is used before dlio::log::setLoggingSystem"};
    }
    return detail::logging_system;
  }

  inline Logger createLogger(const std::string &tag,
                             const std::string &group = kDefaultGroupName) {
    return loggingSystem()->getLogger(tag, group);
  }

  inline void setLevelOfGroup(const std::string &group, Level level) {
    loggingSystem()->setLevelOfGroup(group, level);
  }
}  // namespace dlio::log
