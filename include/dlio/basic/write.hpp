/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <stdexcept>

#include <dlio/basic/writer.hpp>
#include <dlio/io/error.hpp>

namespace dlio {
  /**
   * Write all of `in`, continuing after partial writes.
   * A sink that accepts nothing fails with `IoError::WRITE_ZERO`.
   */
  inline CoroOutcome<void> write(std::shared_ptr<basic::Writer> writer,
                                 BytesIn in) {
    while (not in.empty()) {
      BOOST_OUTCOME_CO_TRY(auto n, co_await writer->writeSome(in));
      if (n == 0) {
        co_return IoError::WRITE_ZERO;
      }
      if (n > in.size()) {
        throw std::logic_error{"dlio::write too much bytes written"};
      }
      in = in.subspan(n);
    }
    co_return outcome::success();
  }
}  // namespace dlio
