/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/awaitable.hpp>
#include <qtils/outcome.hpp>

namespace dlio {
  /**
   * Return type for coroutine.
   *
   * Does not resume when:
   * - called directly outside executor, returns coroutine.
   * - `coroSpawn` called when not running inside executor,
   *   resumes on next executor tick.
   * Resumes when:
   * - `coroSpawn` when running inside specified executor.
   * - `co_await`
   * After resuming may complete before specified statement ends.
   */
  template <typename T>
  using Coro = boost::asio::awaitable<T>;

  /**
   * Return type for coroutine returning outcome.
   */
  template <typename T>
  using CoroOutcome = Coro<outcome::result<T>>;
}  // namespace dlio
