/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dlio/io/copy.hpp>

#include <algorithm>
#include <stdexcept>
#include <vector>

#include <dlio/basic/write.hpp>

namespace dlio {
  namespace {
    log::Logger copyLog() {
      static log::Logger logger = log::createLogger("Copy");
      return logger;
    }
  }  // namespace

  uint64_t reportGranularity(uint64_t total_bytes, const CopyConfig &config) {
    if (config.report_divisor == 0) {
      return std::min(total_bytes, config.max_report_granularity);
    }
    return std::min(total_bytes / config.report_divisor,
                    config.max_report_granularity);
  }

  CoroOutcome<uint64_t> copyWithProgress(ReportCopyProgress &reporter,
                                         std::shared_ptr<basic::Reader> reader,
                                         std::shared_ptr<basic::Writer> writer,
                                         uint64_t total_bytes,
                                         CopyConfig config) {
    auto log = copyLog();
    std::vector<uint8_t> buf(std::max<size_t>(config.buffer_size, 1));
    uint64_t bytes_so_far = 0;
    uint64_t bytes_last_reported = 0;
    const auto report_granularity = reportGranularity(total_bytes, config);

    log->debug("copy started, expected {} bytes, report every {} bytes",
               total_bytes,
               report_granularity);
    reporter.reportProgress(0, total_bytes);

    while (true) {
      auto read_result = co_await reader->readSome(buf);
      if (not read_result.has_value()) {
        log->warn("copy read failed after {} bytes: {}",
                  bytes_so_far,
                  read_result.error().message());
        co_return read_result.error();
      }
      auto n = read_result.value();
      if (n == 0) {
        break;
      }
      if (n > buf.size()) {
        throw std::logic_error{"dlio::copyWithProgress too much bytes read"};
      }

      auto write_result =
          co_await write(writer, BytesIn{buf}.first(n));
      if (not write_result.has_value()) {
        log->warn("copy write failed after {} bytes: {}",
                  bytes_so_far,
                  write_result.error().message());
        co_return write_result.error();
      }

      bytes_so_far += n;
      if (bytes_so_far - bytes_last_reported > report_granularity) {
        bytes_last_reported = bytes_so_far;
        reporter.reportProgress(bytes_so_far, total_bytes);
      }
    }

    reporter.reportProgress(bytes_so_far, total_bytes);
    log->debug("copy finished, {} bytes", bytes_so_far);
    co_return bytes_so_far;
  }

}  // namespace dlio
