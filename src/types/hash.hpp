/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_arr.hpp>

namespace oppool {
  using Hash = qtils::ByteArr<32>;
  /// SSZ hash tree root
  using Root = Hash;
}  // namespace oppool
