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
   * Asynchronous byte source.
   */
  struct Reader {
    virtual ~Reader() = default;

    /**
     * Read up to `out.size()` bytes into `out`.
     * @return number of bytes read, 0 at end of stream
     */
    virtual CoroOutcome<size_t> readSome(BytesOut out) = 0;
  };

}  // namespace dlio::basic
