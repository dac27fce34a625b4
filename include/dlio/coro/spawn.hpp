/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <exception>
#include <type_traits>

#include <boost/asio/co_spawn.hpp>
#include <dlio/coro/coro.hpp>

namespace dlio {
  template <typename T>
  concept CoroSpawnExecutor =
      boost::asio::is_executor<std::remove_cvref_t<T>>::value
      || boost::asio::execution::is_executor<std::remove_cvref_t<T>>::value
      || std::is_convertible_v<T, boost::asio::execution_context &>;

  /**
   * Start detached coroutine on specified executor.
   * Exceptions escaping the coroutine are rethrown from the executor.
   */
  void coroSpawn(CoroSpawnExecutor auto &&executor, Coro<void> &&coro) {
    boost::asio::co_spawn(std::forward<decltype(executor)>(executor),
                          std::move(coro),
                          [](std::exception_ptr e) {
                            if (e != nullptr) {
                              std::rethrow_exception(e);
                            }
                          });
  }
}  // namespace dlio
