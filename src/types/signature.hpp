/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_arr.hpp>

namespace oppool {
  /// Compressed G1 point
  using BlsPublicKey = qtils::ByteArr<48>;
  /// Compressed G2 point
  using BlsSignature = qtils::ByteArr<96>;
}  // namespace oppool
