/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Rejection reasons of the operation validity rules.
 *
 * Insert calls of the operation pool surface these unchanged.
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace oppool::state_processing {

  enum class AttestationValidationError : uint8_t {
    TARGET_EPOCH_OUT_OF_RANGE = 1,
    TARGET_EPOCH_SLOT_MISMATCH,
    INCLUDED_TOO_EARLY,
    INCLUDED_TOO_LATE,
    WRONG_JUSTIFIED_CHECKPOINT,
    EMPTY_AGGREGATION_BITS,
    UNKNOWN_VALIDATOR,
    BAD_SIGNATURE,
  };

  enum class ProposerSlashingValidationError : uint8_t {
    PROPOSAL_SLOT_MISMATCH = 1,
    PROPOSER_INDEX_MISMATCH,
    PROPOSALS_IDENTICAL,
    PROPOSER_UNKNOWN,
    PROPOSER_NOT_SLASHABLE,
    BAD_PROPOSAL_1_SIGNATURE,
    BAD_PROPOSAL_2_SIGNATURE,
  };

  enum class AttesterSlashingValidationError : uint8_t {
    NOT_SLASHABLE = 1,
    INDICES_EMPTY,
    INDICES_NOT_SORTED,
    UNKNOWN_VALIDATOR,
    BAD_SIGNATURE,
    NO_SLASHABLE_INDICES,
  };

  enum class ExitValidationError : uint8_t {
    VALIDATOR_UNKNOWN = 1,
    NOT_ACTIVE,
    ALREADY_EXITED,
    FUTURE_EPOCH,
    TOO_YOUNG_TO_EXIT,
    BAD_SIGNATURE,
  };

}  // namespace oppool::state_processing

OUTCOME_HPP_DECLARE_ERROR(oppool::state_processing, AttestationValidationError);
OUTCOME_HPP_DECLARE_ERROR(oppool::state_processing,
                          ProposerSlashingValidationError);
OUTCOME_HPP_DECLARE_ERROR(oppool::state_processing,
                          AttesterSlashingValidationError);
OUTCOME_HPP_DECLARE_ERROR(oppool::state_processing, ExitValidationError);
