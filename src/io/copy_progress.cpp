/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dlio/io/copy_progress.hpp>

namespace dlio {

  LoggingCopyProgress::LoggingCopyProgress(std::string name, log::Logger log)
      : name_{std::move(name)}, log_{std::move(log)} {}

  void LoggingCopyProgress::reportProgress(uint64_t bytes_so_far,
                                           uint64_t total_bytes) {
    if (total_bytes == 0) {
      log_->info("{}: {} bytes", name_, bytes_so_far);
      return;
    }
    // total is an estimate, progress may run past it
    auto percent = bytes_so_far * 100 / total_bytes;
    log_->info("{}: {}/{} bytes ({}%)",
               name_,
               bytes_so_far,
               total_bytes,
               percent);
  }

}  // namespace dlio
