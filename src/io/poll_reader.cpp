/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dlio/io/poll_reader.hpp>

#include <utility>

#include <boost/asio/post.hpp>

#include <dlio/coro/spawn.hpp>
#include <dlio/io/error.hpp>
#include <qtils/option_take.hpp>

namespace dlio {
  namespace {
    /**
     * Marks a read active until its frame ends, also when the frame is
     * destroyed while suspended.
     */
    class ActiveReadGuard {
     public:
      explicit ActiveReadGuard(std::shared_ptr<bool> active)
          : active_{std::move(active)} {
        *active_ = true;
      }
      ~ActiveReadGuard() {
        *active_ = false;
      }

      ActiveReadGuard(const ActiveReadGuard &) = delete;
      void operator=(const ActiveReadGuard &) = delete;
      ActiveReadGuard(ActiveReadGuard &&) = delete;
      void operator=(ActiveReadGuard &&) = delete;

     private:
      std::shared_ptr<bool> active_;
    };
  }  // namespace

  PollReader::PollReader(boost::asio::any_io_executor executor,
                         Producer producer)
      : executor_{std::move(executor)},
        state_{std::make_shared<State>(State{.producer = std::move(producer)})} {
  }

  PollIo PollReader::pollRead(ReadCursor &target, Waker waker) {
    if (auto tail = read_buffer_.takeData()) {
      auto poll =
          read_buffer_.putData(target, std::move(tail->bytes), tail->offset);
      if (poll.isReady()) {
        return poll;
      }
    }
    if (finished_) {
      return PollIo{*finished_};
    }

    while (true) {
      if (auto produced = qtils::optionTake(state_->produced)) {
        if (not produced->has_value()) {
          log_->warn("producer failed: {}", produced->error().message());
          finished_.emplace(produced->error());
          return PollIo{*finished_};
        }
        auto &batch = produced->value();
        if (not batch) {
          log_->debug("producer reached end of stream");
          finished_.emplace(outcome::success());
          return PollIo{*finished_};
        }
        auto poll = read_buffer_.putData(target, std::move(*batch), 0);
        if (poll.isReady()) {
          return poll;
        }
        log_->trace("empty batch, producing again");
      }
      state_->waker = waker;
      if (not state_->producing) {
        startProducing();
      }
      // production may complete immediately when spawned on current executor
      if (not state_->produced) {
        return PollIo::pending();
      }
    }
  }

  void PollReader::startProducing() {
    state_->producing = true;
    coroSpawn(executor_, [](std::shared_ptr<State> state) -> Coro<void> {
      auto result = co_await state->producer();
      state->producing = false;
      state->produced.emplace(std::move(result));
      if (auto waker = std::exchange(state->waker, nullptr)) {
        waker();
      }
    }(state_));
  }

  CoroOutcome<size_t> PollReader::readSome(BytesOut out) {
    if (state_->read_active) {
      co_return IoError::READ_IN_PROGRESS;
    }
    if (out.empty()) {
      co_return size_t{0};
    }
    ActiveReadGuard guard{std::shared_ptr<bool>{state_, &state_->read_active}};
    std::weak_ptr<State> weak_state = state_;
    auto waker = [weak_state] {
      auto state = weak_state.lock();
      if (not state) {
        return;
      }
      // resume on executor of the suspended read
      if (auto reading = qtils::optionTake(state->reading)) {
        auto executor = reading->get_executor();
        boost::asio::post(executor,
                          [handler{std::move(reading.value())}]() mutable {
                            handler();
                          });
      }
    };
    while (true) {
      ReadCursor cursor{out};
      auto poll = pollRead(cursor, waker);
      if (poll.isReady()) {
        auto &r = poll.value();
        if (not r.has_value()) {
          co_return r.error();
        }
        co_return cursor.filled().size();
      }
      co_await coroHandler<void>([&](CoroHandler<void> &&handler) {
        state_->reading.emplace(std::move(handler));
      });
    }
  }

}  // namespace dlio
