/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>

#include <boost/asio/any_io_executor.hpp>

#include <dlio/basic/reader.hpp>
#include <dlio/coro/handler.hpp>
#include <dlio/io/poll.hpp>
#include <dlio/io/read_buffer.hpp>
#include <dlio/log/logger.hpp>

namespace dlio {

  /**
   * Exposes a producer of batches as poll-based and coroutine readers.
   *
   * Producer is called to get the next batch only when previous batch was
   * completely delivered. Producer returning `std::nullopt` ends the
   * stream, producer error fails it, both are reported on every following
   * read. Empty batch means "no data yet" and producer is called again.
   *
   * At most one production is in flight. Reader must be driven by one
   * consumer at a time.
   */
  class PollReader : public PollReadable, public basic::Reader {
   public:
    using Batch = std::optional<Bytes>;
    using Producer = std::function<CoroOutcome<Batch>()>;

    PollReader(boost::asio::any_io_executor executor, Producer producer);

    // clang-tidy cppcoreguidelines-special-member-functions
    PollReader(const PollReader &) = delete;
    void operator=(const PollReader &) = delete;
    PollReader(PollReader &&) = delete;
    void operator=(PollReader &&) = delete;
    ~PollReader() override = default;

    PollIo pollRead(ReadCursor &target, Waker waker) override;

    /**
     * Read via `pollRead`, suspending while it is pending.
     * Concurrent call fails with `IoError::READ_IN_PROGRESS`.
     */
    CoroOutcome<size_t> readSome(BytesOut out) override;

   private:
    // Shared with in-flight production, which may outlive reader.
    struct State {
      Producer producer;
      bool producing = false;
      std::optional<outcome::result<Batch>> produced;
      Waker waker;
      std::optional<CoroHandler<void>> reading;
      bool read_active = false;
    };

    void startProducing();

    boost::asio::any_io_executor executor_;
    std::shared_ptr<State> state_;
    ReadBuffer read_buffer_;
    std::optional<outcome::result<void>> finished_;
    log::Logger log_ = log::createLogger("PollReader");
  };

}  // namespace dlio
