/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace oppool::op_pool {

  enum class OperationPoolError : uint8_t {
    AGGREGATION_FAILED = 1,        ///< signatures could not be combined
    SNAPSHOT_DECODE_FAILED,        ///< snapshot is not a valid encoding
    UNSUPPORTED_SNAPSHOT_VERSION,  ///< snapshot format version is unknown
    CORRUPTED_SNAPSHOT,            ///< snapshot content is inconsistent
    SNAPSHOT_TOO_LARGE,            ///< store exceeds snapshot list limits
  };

}  // namespace oppool::op_pool

OUTCOME_HPP_DECLARE_ERROR(oppool::op_pool, OperationPoolError);
