/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <functional>
#include <optional>
#include <stdexcept>

#include <dlio/common/types.hpp>

namespace dlio {

  /**
   * Result of a poll step: either pending or ready with value.
   */
  template <typename T>
  class Poll {
   public:
    static Poll pending() {
      return Poll{};
    }

    Poll(T value) : value_{std::move(value)} {}

    bool isPending() const {
      return not value_.has_value();
    }
    bool isReady() const {
      return value_.has_value();
    }

    T &value() {
      return value_.value();
    }
    const T &value() const {
      return value_.value();
    }

   private:
    Poll() = default;

    std::optional<T> value_;
  };

  /**
   * Poll result of a read.
   * Ready with success and nothing filled means end of stream.
   */
  using PollIo = Poll<outcome::result<void>>;

  /**
   * Called when pending operation can make progress.
   */
  using Waker = std::function<void()>;

  /**
   * Caller buffer being filled by a poll read.
   */
  class ReadCursor {
   public:
    explicit ReadCursor(BytesOut buf) : buf_{buf} {}

    size_t remaining() const {
      return buf_.size() - filled_;
    }
    BytesIn filled() const {
      return BytesIn{buf_}.first(filled_);
    }

    void put(BytesIn in) {
      if (in.size() > remaining()) {
        throw std::logic_error{"dlio::ReadCursor::put overflow"};
      }
      std::copy(in.begin(), in.end(), buf_.begin() + filled_);
      filled_ += in.size();
    }

   private:
    BytesOut buf_;
    size_t filled_ = 0;
  };

  /**
   * Poll-based byte source.
   */
  struct PollReadable {
    virtual ~PollReadable() = default;

    /**
     * Fill some of `target`.
     * When pending, `waker` is called once it is worth polling again.
     */
    virtual PollIo pollRead(ReadCursor &target, Waker waker) = 0;
  };

}  // namespace dlio
