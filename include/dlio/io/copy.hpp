/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <memory>

#include <dlio/basic/reader.hpp>
#include <dlio/basic/writer.hpp>
#include <dlio/io/copy_progress.hpp>

namespace dlio {

  struct CopyConfig {
    /**
     * Size of intermediate buffer, maximal size of single read.
     */
    size_t buffer_size = size_t{8} << 10;
    /**
     * Report about every `1 / report_divisor` of expected total.
     */
    uint64_t report_divisor = 10;
    /**
     * Upper bound of bytes between reports for large totals.
     */
    uint64_t max_report_granularity = uint64_t{2} << 20;
  };

  /**
   * Minimal number of bytes copied between two intermediate reports.
   * Zero when `total_bytes` is zero, so every read is reported.
   */
  uint64_t reportGranularity(uint64_t total_bytes,
                             const CopyConfig &config = {});

  /**
   * Copy everything from `reader` to `writer` until end of stream.
   *
   * Reports `(0, total_bytes)` before the first read, then after each
   * write that moved progress past the report granularity, and
   * `(copied, total_bytes)` once more on completion.
   * `total_bytes` is only an estimate used for reporting.
   *
   * The first read or write error is returned as is, bytes written
   * before it stay in `writer`. No final report is made then.
   *
   * @return number of bytes copied
   */
  CoroOutcome<uint64_t> copyWithProgress(ReportCopyProgress &reporter,
                                         std::shared_ptr<basic::Reader> reader,
                                         std::shared_ptr<basic::Writer> writer,
                                         uint64_t total_bytes,
                                         CopyConfig config = {});

}  // namespace dlio
