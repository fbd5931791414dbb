/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace oppool {
  using ValidatorIndex = uint64_t;
}  // namespace oppool
