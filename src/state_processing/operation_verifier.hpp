/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <vector>

#include <qtils/outcome.hpp>

#include "state_processing/errors.hpp"
#include "types/attestation.hpp"
#include "types/attester_slashing.hpp"
#include "types/chain_spec.hpp"
#include "types/proposer_slashing.hpp"
#include "types/state.hpp"
#include "types/voluntary_exit.hpp"

namespace oppool::state_processing {

  enum class VerifySignatures : bool {
    False = false,
    True = true,
  };

  /**
   * Predicate telling which validators count as already slashed.
   */
  using AlreadySlashed =
      std::function<bool(ValidatorIndex index, const Validator &validator)>;

  /**
   * Stateless validity rules of block operations against a reference state.
   */
  class OperationVerifier {
   public:
    virtual ~OperationVerifier() = default;

    virtual outcome::result<void> verifyAttestationForBlockInclusion(
        const State &state,
        const Attestation &attestation,
        VerifySignatures verify_signatures,
        const ChainSpec &spec) const = 0;

    virtual outcome::result<void> verifyProposerSlashing(
        const ProposerSlashing &slashing,
        const State &state,
        VerifySignatures verify_signatures,
        const ChainSpec &spec) const = 0;

    /// Returns slashable indices, that must be non-empty
    virtual outcome::result<std::vector<ValidatorIndex>> verifyAttesterSlashing(
        const State &state,
        const AttesterSlashing &slashing,
        VerifySignatures verify_signatures,
        const ChainSpec &spec) const = 0;

    /**
     * Sorted indices attesting in both attestations, slashable at the current
     * epoch and not reported by `already_slashed`.
     * Fails with `NO_SLASHABLE_INDICES` when none is left.
     */
    virtual outcome::result<std::vector<ValidatorIndex>> getSlashableIndices(
        const State &state,
        const AttesterSlashing &slashing,
        const AlreadySlashed &already_slashed,
        const ChainSpec &spec) const = 0;

    /// Exit checks that do not depend on the state epoch
    virtual outcome::result<void> verifyExitTimeIndependentOnly(
        const State &state,
        const SignedVoluntaryExit &exit,
        VerifySignatures verify_signatures,
        const ChainSpec &spec) const = 0;

    virtual outcome::result<void> verifyExit(
        const State &state,
        const SignedVoluntaryExit &exit,
        VerifySignatures verify_signatures,
        const ChainSpec &spec) const = 0;
  };

}  // namespace oppool::state_processing
