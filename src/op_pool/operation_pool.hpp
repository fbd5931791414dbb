/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "op_pool/attestation_id.hpp"
#include "types/attestation.hpp"
#include "types/attester_slashing.hpp"
#include "types/chain_spec.hpp"
#include "types/proposer_slashing.hpp"
#include "types/state.hpp"
#include "types/voluntary_exit.hpp"
#include "utils/safe_object.hpp"

namespace oppool::crypto::bls {
  class BlsProvider;
}  // namespace oppool::crypto::bls

namespace oppool::state_processing {
  class OperationVerifier;
}  // namespace oppool::state_processing

namespace oppool::op_pool {

  struct PersistedOperationPool;

  /**
   * Pool of operations waiting for inclusion into a block.
   *
   * Each of the four stores has its own lock, and no call holds two locks
   * at once.
   */
  class OperationPool {
   public:
    using AttestationBuckets =
        std::map<AttestationId, std::vector<Attestation>>;
    using AttesterSlashingId = std::pair<AttestationId, AttestationId>;
    using AttesterSlashings = std::map<AttesterSlashingId, AttesterSlashing>;
    using ProposerSlashings = std::map<ValidatorIndex, ProposerSlashing>;
    using VoluntaryExits = std::map<ValidatorIndex, SignedVoluntaryExit>;
    using ToBeSlashed = std::unordered_set<ValidatorIndex>;

    OperationPool(qtils::SharedRef<log::LoggingSystem> logsys,
                  qtils::SharedRef<state_processing::OperationVerifier> verifier,
                  qtils::SharedRef<crypto::bls::BlsProvider> bls_provider);

    /**
     * Insert an attestation, aggregating it into the first entry with
     * disjoint signers. The attestation is assumed to be valid.
     */
    outcome::result<void> insertAttestation(const Attestation &attestation,
                                            const State &state,
                                            const ChainSpec &spec);

    /// Total number of attestations, including ones with equal data
    size_t numAttestations() const;

    /// Best attestations for inclusion into a block built on `state`
    std::vector<Attestation> getAttestations(const State &state,
                                             const ChainSpec &spec) const;

    /// Remove attestations too old to be included into a block
    void pruneAttestations(const State &finalized_state,
                           const ChainSpec &spec);

    outcome::result<void> insertProposerSlashing(
        const ProposerSlashing &slashing,
        const State &state,
        const ChainSpec &spec);

    outcome::result<void> insertAttesterSlashing(
        const AttesterSlashing &slashing,
        const State &state,
        const ChainSpec &spec);

    /**
     * Proposer and attester slashings for inclusion into one block.
     * Attester slashings which would slash only validators already slashed
     * by previously selected slashings are skipped.
     */
    std::pair<std::vector<ProposerSlashing>, std::vector<AttesterSlashing>>
    getSlashings(const State &state, const ChainSpec &spec) const;

    /**
     * Attester slashings slashing at least one validator neither slashed in
     * `state` nor contained in `to_be_slashed`.
     * Extends `to_be_slashed` with validators of selected slashings.
     */
    std::vector<AttesterSlashing> selectAttesterSlashings(
        const State &state,
        const ChainSpec &spec,
        ToBeSlashed &to_be_slashed) const;

    /// Remove proposer slashings of slashed or withdrawable validators
    void pruneProposerSlashings(const State &finalized_state,
                                const ChainSpec &spec);

    /// Remove attester slashings of other forks or slashing nobody
    void pruneAttesterSlashings(const State &finalized_state,
                                const ChainSpec &spec);

    size_t numProposerSlashings() const;

    size_t numAttesterSlashings() const;

    /// Insert an exit, future exit epochs are allowed
    outcome::result<void> insertVoluntaryExit(const SignedVoluntaryExit &exit,
                                              const State &state,
                                              const ChainSpec &spec);

    std::vector<SignedVoluntaryExit> getVoluntaryExits(
        const State &state, const ChainSpec &spec) const;

    /// Remove exits of validators already exited
    void pruneVoluntaryExits(const State &finalized_state,
                             const ChainSpec &spec);

    size_t numVoluntaryExits() const;

    /// Prune all stores given the latest finalized state
    void pruneAll(const State &finalized_state, const ChainSpec &spec);

    bool operator==(const OperationPool &other) const;

   private:
    friend struct PersistedOperationPool;

    static AttesterSlashingId attesterSlashingId(
        const AttesterSlashing &slashing,
        const State &state,
        const ChainSpec &spec);

    log::Logger logger_;
    qtils::SharedRef<state_processing::OperationVerifier> verifier_;
    qtils::SharedRef<crypto::bls::BlsProvider> bls_provider_;

    utils::SafeObject<AttestationBuckets> attestations_;
    utils::SafeObject<AttesterSlashings> attester_slashings_;
    utils::SafeObject<ProposerSlashings> proposer_slashings_;
    utils::SafeObject<VoluntaryExits> voluntary_exits_;
  };

}  // namespace oppool::op_pool
