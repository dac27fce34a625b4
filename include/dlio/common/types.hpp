/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include <qtils/bytes.hpp>
#include <qtils/outcome.hpp>

namespace dlio {
  using qtils::Bytes;
  using qtils::BytesIn;
  using qtils::BytesOut;
}  // namespace dlio
