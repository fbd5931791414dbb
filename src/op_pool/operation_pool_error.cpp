/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "op_pool/operation_pool_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(oppool::op_pool, OperationPoolError, e) {
  using E = OperationPoolError;
  switch (e) {
    case E::AGGREGATION_FAILED:
      return "failed to aggregate attestation signatures";
    case E::SNAPSHOT_DECODE_FAILED:
      return "operation pool snapshot can't be decoded";
    case E::UNSUPPORTED_SNAPSHOT_VERSION:
      return "unsupported operation pool snapshot version";
    case E::CORRUPTED_SNAPSHOT:
      return "operation pool snapshot is corrupted";
    case E::SNAPSHOT_TOO_LARGE:
      return "operation pool is too large for a snapshot";
  }
  return "unknown operation pool error";
}
