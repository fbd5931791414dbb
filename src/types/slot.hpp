/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace oppool {
  using Slot = uint64_t;
  using Epoch = uint64_t;
  using Gwei = uint64_t;
}  // namespace oppool
