/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/shared_ref.hpp>

#include "state_processing/operation_verifier.hpp"

namespace oppool::crypto::bls {
  class BlsProvider;
}  // namespace oppool::crypto::bls

namespace oppool::state_processing {

  /**
   * Phase 0 inclusion rules of block operations, without committee
   * shuffling: aggregation bits are indexed by validator index.
   */
  class OperationVerifierImpl final : public OperationVerifier {
   public:
    explicit OperationVerifierImpl(
        qtils::SharedRef<crypto::bls::BlsProvider> bls_provider);

    // OperationVerifier
    outcome::result<void> verifyAttestationForBlockInclusion(
        const State &state,
        const Attestation &attestation,
        VerifySignatures verify_signatures,
        const ChainSpec &spec) const override;
    outcome::result<void> verifyProposerSlashing(
        const ProposerSlashing &slashing,
        const State &state,
        VerifySignatures verify_signatures,
        const ChainSpec &spec) const override;
    outcome::result<std::vector<ValidatorIndex>> verifyAttesterSlashing(
        const State &state,
        const AttesterSlashing &slashing,
        VerifySignatures verify_signatures,
        const ChainSpec &spec) const override;
    outcome::result<std::vector<ValidatorIndex>> getSlashableIndices(
        const State &state,
        const AttesterSlashing &slashing,
        const AlreadySlashed &already_slashed,
        const ChainSpec &spec) const override;
    outcome::result<void> verifyExitTimeIndependentOnly(
        const State &state,
        const SignedVoluntaryExit &exit,
        VerifySignatures verify_signatures,
        const ChainSpec &spec) const override;
    outcome::result<void> verifyExit(const State &state,
                                     const SignedVoluntaryExit &exit,
                                     VerifySignatures verify_signatures,
                                     const ChainSpec &spec) const override;

   private:
    outcome::result<void> verifyIndexedAttestation(
        const State &state,
        const IndexedAttestation &indexed_attestation,
        VerifySignatures verify_signatures,
        const ChainSpec &spec) const;

    /// Checks of `verifyExit`, optionally skipping the epoch dependent ones
    outcome::result<void> verifyExitParametric(
        const State &state,
        const SignedVoluntaryExit &exit,
        VerifySignatures verify_signatures,
        bool time_independent_only,
        const ChainSpec &spec) const;

    qtils::SharedRef<crypto::bls::BlsProvider> bls_provider_;
  };

}  // namespace oppool::state_processing
