/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "state_processing/errors.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(oppool::state_processing,
                            AttestationValidationError,
                            e) {
  using E = AttestationValidationError;
  switch (e) {
    case E::TARGET_EPOCH_OUT_OF_RANGE:
      return "attestation target epoch is neither previous nor current";
    case E::TARGET_EPOCH_SLOT_MISMATCH:
      return "attestation target epoch does not match its slot";
    case E::INCLUDED_TOO_EARLY:
      return "attestation inclusion delay is not reached";
    case E::INCLUDED_TOO_LATE:
      return "attestation is older than one epoch";
    case E::WRONG_JUSTIFIED_CHECKPOINT:
      return "attestation source is not the justified checkpoint";
    case E::EMPTY_AGGREGATION_BITS:
      return "attestation has no signers";
    case E::UNKNOWN_VALIDATOR:
      return "attestation signer is not a known validator";
    case E::BAD_SIGNATURE:
      return "attestation aggregate signature is invalid";
  }
  return "unknown attestation validation error";
}

OUTCOME_CPP_DEFINE_CATEGORY(oppool::state_processing,
                            ProposerSlashingValidationError,
                            e) {
  using E = ProposerSlashingValidationError;
  switch (e) {
    case E::PROPOSAL_SLOT_MISMATCH:
      return "proposer slashing headers have different slots";
    case E::PROPOSER_INDEX_MISMATCH:
      return "proposer slashing headers have different proposers";
    case E::PROPOSALS_IDENTICAL:
      return "proposer slashing headers are identical";
    case E::PROPOSER_UNKNOWN:
      return "proposer is not a known validator";
    case E::PROPOSER_NOT_SLASHABLE:
      return "proposer is not slashable";
    case E::BAD_PROPOSAL_1_SIGNATURE:
      return "first header signature is invalid";
    case E::BAD_PROPOSAL_2_SIGNATURE:
      return "second header signature is invalid";
  }
  return "unknown proposer slashing validation error";
}

OUTCOME_CPP_DEFINE_CATEGORY(oppool::state_processing,
                            AttesterSlashingValidationError,
                            e) {
  using E = AttesterSlashingValidationError;
  switch (e) {
    case E::NOT_SLASHABLE:
      return "attestations are neither a double vote nor a surround vote";
    case E::INDICES_EMPTY:
      return "indexed attestation has no attesting indices";
    case E::INDICES_NOT_SORTED:
      return "indexed attestation indices are not sorted and unique";
    case E::UNKNOWN_VALIDATOR:
      return "indexed attestation refers to an unknown validator";
    case E::BAD_SIGNATURE:
      return "indexed attestation signature is invalid";
    case E::NO_SLASHABLE_INDICES:
      return "attester slashing slashes nobody";
  }
  return "unknown attester slashing validation error";
}

OUTCOME_CPP_DEFINE_CATEGORY(oppool::state_processing, ExitValidationError, e) {
  using E = ExitValidationError;
  switch (e) {
    case E::VALIDATOR_UNKNOWN:
      return "exiting validator is unknown";
    case E::NOT_ACTIVE:
      return "exiting validator is not active";
    case E::ALREADY_EXITED:
      return "validator has already initiated exit";
    case E::FUTURE_EPOCH:
      return "exit epoch is not reached";
    case E::TOO_YOUNG_TO_EXIT:
      return "validator has not been active long enough";
    case E::BAD_SIGNATURE:
      return "exit signature is invalid";
  }
  return "unknown exit validation error";
}
