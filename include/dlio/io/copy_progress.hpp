/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include <dlio/log/logger.hpp>

namespace dlio {

  /**
   * Receives progress updates of a copy operation.
   * Called inline from the copy loop, must not block.
   */
  class ReportCopyProgress {
   public:
    virtual ~ReportCopyProgress() = default;

    virtual void reportProgress(uint64_t bytes_so_far,
                                uint64_t total_bytes) = 0;
  };

  /**
   * Doesn't emit anything.
   */
  class SilentCopyProgress : public ReportCopyProgress {
   public:
    void reportProgress(uint64_t, uint64_t) override {}
  };

  /**
   * Writes progress lines to a logger, prefixed with `name`.
   */
  class LoggingCopyProgress : public ReportCopyProgress {
   public:
    explicit LoggingCopyProgress(std::string name,
                                 log::Logger log = log::createLogger("Copy"));

    void reportProgress(uint64_t bytes_so_far, uint64_t total_bytes) override;

   private:
    std::string name_;
    log::Logger log_;
  };

  /**
   * Forwards progress to a function, e.g. a progress bar.
   */
  class CallbackCopyProgress : public ReportCopyProgress {
   public:
    using Callback = std::function<void(uint64_t, uint64_t)>;

    explicit CallbackCopyProgress(Callback callback)
        : callback_{std::move(callback)} {}

    void reportProgress(uint64_t bytes_so_far, uint64_t total_bytes) override {
      if (callback_) {
        callback_(bytes_so_far, total_bytes);
      }
    }

   private:
    Callback callback_;
  };

}  // namespace dlio
