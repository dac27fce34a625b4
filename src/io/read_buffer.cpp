/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dlio/io/read_buffer.hpp>

#include <qtils/option_take.hpp>

namespace dlio {

  std::optional<ReadBuffer::Tail> ReadBuffer::takeData() {
    return qtils::optionTake(tail_);
  }

  PollIo ReadBuffer::putData(ReadCursor &target, Bytes bytes, size_t start) {
    if (bytes.empty()) {
      tail_.reset();
      return PollIo::pending();
    }
    if (start > bytes.size()) {
      throw std::logic_error{"dlio::ReadBuffer::putData start out of range"};
    }

    BytesIn rest{bytes};
    rest = rest.subspan(start);
    if (target.remaining() >= rest.size()) {
      target.put(rest);
      tail_.reset();
    } else {
      auto end = start + target.remaining();
      target.put(rest.first(target.remaining()));
      tail_.emplace(Tail{std::move(bytes), end});
    }
    return PollIo{outcome::success()};
  }

}  // namespace dlio
