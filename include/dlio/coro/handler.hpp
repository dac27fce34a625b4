/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <concepts>
#include <cstdlib>

#include <boost/asio/use_awaitable.hpp>

#include <dlio/coro/coro.hpp>

namespace dlio {
  template <typename T>
  using CoroHandler = std::conditional_t<
      std::is_void_v<T>,
      boost::asio::detail::awaitable_handler<typename Coro<T>::executor_type>,
      boost::asio::detail::awaitable_handler<typename Coro<T>::executor_type,
                                             T>>;

  /**
   * Suspend current coroutine and pass its continuation to `f`.
   * Calling the handler resumes the coroutine.
   * Coroutine may complete earlier than handler returns.
   */
  template <typename T>
  Coro<T> coroHandler(std::invocable<CoroHandler<T> &&> auto &&f) {
    co_await [&](auto *frame) {
      f(CoroHandler<T>{frame->detach_thread()});
      return nullptr;
    };
    abort();
  }
}  // namespace dlio
