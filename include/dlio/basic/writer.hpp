/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <dlio/common/types.hpp>
#include <dlio/coro/coro.hpp>

namespace dlio::basic {

  /**
   * Asynchronous byte sink.
   */
  struct Writer {
    virtual ~Writer() = default;

    /**
     * Write a prefix of `in`.
     * @return number of bytes accepted, may be less than `in.size()`
     */
    virtual CoroOutcome<size_t> writeSome(BytesIn in) = 0;
  };

}  // namespace dlio::basic
