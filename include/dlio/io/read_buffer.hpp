/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <dlio/io/poll.hpp>

namespace dlio {

  /**
   * Used when exposing batches of data through a poll-based read.
   * Keeps the part of the last batch that didn't fit the caller buffer,
   * so it is delivered on next poll without producing a new batch.
   */
  class ReadBuffer {
   public:
    struct Tail {
      Bytes bytes;
      /// Bytes before `offset` were delivered already.
      size_t offset = 0;
    };

    /**
     * Remove and return stored data.
     */
    std::optional<Tail> takeData();

    bool empty() const {
      return not tail_.has_value();
    }

    /**
     * Write as much of `bytes` starting at `start` as fits into
     * `target`, keep the rest.
     *
     * Empty `bytes` is pending, not ready: ready with nothing written
     * would signal end of stream.
     */
    PollIo putData(ReadCursor &target, Bytes bytes, size_t start);

   private:
    std::optional<Tail> tail_;
  };

}  // namespace dlio
