/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>

#include <qtils/enum_error_code.hpp>

namespace dlio {

  /**
   * Errors introduced by dlio itself.
   * Errors of sources and sinks are propagated unchanged.
   */
  enum class IoError {
    WRITE_ZERO = 1,
    READ_IN_PROGRESS,
  };

  Q_ENUM_ERROR_CODE(IoError) {
    using E = decltype(e);
    switch (e) {
      case E::WRITE_ZERO:
        return "Sink accepted zero bytes";
      case E::READ_IN_PROGRESS:
        return "Another read is already in progress";
    }
    abort();
  }

}  // namespace dlio
