/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include <dlio/basic/reader.hpp>
#include <dlio/basic/writer.hpp>
#include <dlio/coro/yield.hpp>
#include <dlio/io/copy_progress.hpp>

namespace testutil {
  using dlio::Bytes;
  using dlio::BytesIn;
  using dlio::BytesOut;
  using dlio::CoroOutcome;

  /**
   * Bytes `0, 1, 2, ...` wrapping at 251, so misplaced chunks are visible.
   */
  inline Bytes makeBytes(size_t size) {
    Bytes bytes(size);
    for (size_t i = 0; i < size; ++i) {
      bytes[i] = static_cast<uint8_t>(i % 251);
    }
    return bytes;
  }

  /**
   * Reader replaying a script.
   * Each step is either up to `n` bytes of data or an error.
   * Data step larger than caller buffer is split across reads.
   * After the script end of stream is returned.
   */
  class ScriptedReader : public dlio::basic::Reader {
   public:
    using Step = std::variant<size_t, std::error_code>;

    ScriptedReader(Bytes data, std::vector<Step> steps, bool yield = false)
        : data_{std::move(data)},
          steps_{steps.begin(), steps.end()},
          yield_{yield} {}

    /**
     * Reader returning `data` in chunks of `chunk` bytes.
     */
    static std::shared_ptr<ScriptedReader> chunked(Bytes data,
                                                   size_t chunk,
                                                   bool yield = false) {
      std::vector<Step> steps;
      for (size_t i = 0; i < data.size(); i += chunk) {
        steps.emplace_back(std::min(chunk, data.size() - i));
      }
      return std::make_shared<ScriptedReader>(
          std::move(data), std::move(steps), yield);
    }

    CoroOutcome<size_t> readSome(BytesOut out) override {
      ++reads;
      if (yield_) {
        co_await dlio::coroYield();
      }
      if (steps_.empty()) {
        co_return size_t{0};
      }
      auto &step = steps_.front();
      if (auto *ec = std::get_if<std::error_code>(&step)) {
        auto error = *ec;
        steps_.pop_front();
        co_return error;
      }
      auto &left = std::get<size_t>(step);
      auto n = std::min({left, out.size(), data_.size() - offset_});
      std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(offset_),
                  n,
                  out.begin());
      offset_ += n;
      left -= n;
      if (left == 0) {
        steps_.pop_front();
      }
      co_return n;
    }

    size_t reads = 0;

   private:
    Bytes data_;
    std::deque<Step> steps_;
    size_t offset_ = 0;
    bool yield_;
  };

  /**
   * Writer collecting everything written.
   */
  class MemoryWriter : public dlio::basic::Writer {
   public:
    CoroOutcome<size_t> writeSome(BytesIn in) override {
      ++writes;
      if (yield) {
        co_await dlio::coroYield();
      }
      if (fail_after and written.size() >= *fail_after) {
        co_return std::make_error_code(std::errc::no_space_on_device);
      }
      auto n = std::min(in.size(), max_write);
      if (fail_after) {
        n = std::min(n, *fail_after - written.size());
      }
      written.insert(written.end(), in.begin(), in.begin() + n);
      co_return n;
    }

    Bytes written;
    size_t writes = 0;
    /// Accepted bytes per call, 0 makes every write accept nothing.
    size_t max_write = SIZE_MAX;
    /// Fail once this many bytes were written.
    std::optional<size_t> fail_after;
    bool yield = false;
  };

  /**
   * Remembers every progress report.
   */
  class RecordingProgress : public dlio::ReportCopyProgress {
   public:
    using Report = std::pair<uint64_t, uint64_t>;

    void reportProgress(uint64_t bytes_so_far, uint64_t total_bytes) override {
      reports.emplace_back(bytes_so_far, total_bytes);
    }

    std::vector<Report> reports;
  };

}  // namespace testutil
