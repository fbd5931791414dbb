/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "state_processing/operation_verifier_impl.hpp"

#include <algorithm>
#include <functional>
#include <iterator>
#include <optional>

#include "crypto/bls/bls_provider.hpp"
#include "state_processing/signing_root.hpp"

namespace oppool::state_processing {

  namespace {
    /// Public keys of `indices`, or nothing if some index is unknown
    std::optional<std::vector<BlsPublicKey>> publicKeys(const State &state,
                                                        auto &&indices) {
      std::vector<BlsPublicKey> public_keys;
      for (auto index : indices) {
        auto validator = state.validator(index);
        if (validator == nullptr) {
          return std::nullopt;
        }
        public_keys.emplace_back(validator->pubkey);
      }
      return public_keys;
    }

    bool isSlashableAttestationData(const AttestationData &data_1,
                                    const AttestationData &data_2) {
      auto double_vote =
          data_1 != data_2 and data_1.target.epoch == data_2.target.epoch;
      auto surround_vote = data_1.source.epoch < data_2.source.epoch
                       and data_2.target.epoch < data_1.target.epoch;
      return double_vote or surround_vote;
    }
  }  // namespace

  OperationVerifierImpl::OperationVerifierImpl(
      qtils::SharedRef<crypto::bls::BlsProvider> bls_provider)
      : bls_provider_(std::move(bls_provider)) {}

  outcome::result<void>
  OperationVerifierImpl::verifyAttestationForBlockInclusion(
      const State &state,
      const Attestation &attestation,
      VerifySignatures verify_signatures,
      const ChainSpec &spec) const {
    using E = AttestationValidationError;
    auto &data = attestation.data;
    auto current_epoch = state.currentEpoch(spec);
    auto previous_epoch = state.previousEpoch(spec);

    if (data.target.epoch != current_epoch
        and data.target.epoch != previous_epoch) {
      return E::TARGET_EPOCH_OUT_OF_RANGE;
    }
    if (data.target.epoch != spec.epochAtSlot(data.slot)) {
      return E::TARGET_EPOCH_SLOT_MISMATCH;
    }
    if (data.slot + spec.min_attestation_inclusion_delay > state.slot) {
      return E::INCLUDED_TOO_EARLY;
    }
    if (state.slot > data.slot + spec.slots_per_epoch) {
      return E::INCLUDED_TOO_LATE;
    }

    auto &justified = data.target.epoch == current_epoch
                        ? state.current_justified_checkpoint
                        : state.previous_justified_checkpoint;
    if (data.source != justified) {
      return E::WRONG_JUSTIFIED_CHECKPOINT;
    }

    if (attestation.aggregation_bits.empty()) {
      return E::EMPTY_AGGREGATION_BITS;
    }
    auto public_keys = publicKeys(state, attestation.aggregation_bits.iter());
    if (not public_keys) {
      return E::UNKNOWN_VALIDATOR;
    }

    if (verify_signatures == VerifySignatures::True) {
      auto domain =
          getDomain(state, DOMAIN_BEACON_ATTESTER, data.target.epoch);
      auto signing_root = computeSigningRoot(data, domain);
      if (not bls_provider_->fastAggregateVerify(
              public_keys.value(), signing_root, attestation.signature)) {
        return E::BAD_SIGNATURE;
      }
    }
    return outcome::success();
  }

  outcome::result<void> OperationVerifierImpl::verifyProposerSlashing(
      const ProposerSlashing &slashing,
      const State &state,
      VerifySignatures verify_signatures,
      const ChainSpec &spec) const {
    using E = ProposerSlashingValidationError;
    auto &header_1 = slashing.signed_header_1.message;
    auto &header_2 = slashing.signed_header_2.message;

    if (header_1.slot != header_2.slot) {
      return E::PROPOSAL_SLOT_MISMATCH;
    }
    if (header_1.proposer_index != header_2.proposer_index) {
      return E::PROPOSER_INDEX_MISMATCH;
    }
    if (header_1 == header_2) {
      return E::PROPOSALS_IDENTICAL;
    }

    auto proposer = state.validator(header_1.proposer_index);
    if (proposer == nullptr) {
      return E::PROPOSER_UNKNOWN;
    }
    if (not proposer->isSlashableAt(state.currentEpoch(spec))) {
      return E::PROPOSER_NOT_SLASHABLE;
    }

    if (verify_signatures == VerifySignatures::True) {
      auto verify_header = [&](const SignedBeaconBlockHeader &signed_header) {
        auto domain = getDomain(state,
                                DOMAIN_BEACON_PROPOSER,
                                spec.epochAtSlot(signed_header.message.slot));
        auto signing_root = computeSigningRoot(signed_header.message, domain);
        return bls_provider_->verify(
            proposer->pubkey, signing_root, signed_header.signature);
      };
      if (not verify_header(slashing.signed_header_1)) {
        return E::BAD_PROPOSAL_1_SIGNATURE;
      }
      if (not verify_header(slashing.signed_header_2)) {
        return E::BAD_PROPOSAL_2_SIGNATURE;
      }
    }
    return outcome::success();
  }

  outcome::result<std::vector<ValidatorIndex>>
  OperationVerifierImpl::verifyAttesterSlashing(
      const State &state,
      const AttesterSlashing &slashing,
      VerifySignatures verify_signatures,
      const ChainSpec &spec) const {
    if (not isSlashableAttestationData(slashing.attestation_1.data,
                                       slashing.attestation_2.data)) {
      return AttesterSlashingValidationError::NOT_SLASHABLE;
    }
    OUTCOME_TRY(verifyIndexedAttestation(
        state, slashing.attestation_1, verify_signatures, spec));
    OUTCOME_TRY(verifyIndexedAttestation(
        state, slashing.attestation_2, verify_signatures, spec));
    return getSlashableIndices(
        state,
        slashing,
        [](ValidatorIndex, const Validator &) { return false; },
        spec);
  }

  outcome::result<std::vector<ValidatorIndex>>
  OperationVerifierImpl::getSlashableIndices(
      const State &state,
      const AttesterSlashing &slashing,
      const AlreadySlashed &already_slashed,
      const ChainSpec &spec) const {
    using E = AttesterSlashingValidationError;
    auto indices_1 = slashing.attestation_1.attesting_indices.data();
    auto indices_2 = slashing.attestation_2.attesting_indices.data();
    std::ranges::sort(indices_1);
    std::ranges::sort(indices_2);
    std::vector<ValidatorIndex> both;
    std::ranges::set_intersection(indices_1, indices_2, std::back_inserter(both));
    both.erase(std::unique(both.begin(), both.end()), both.end());

    auto current_epoch = state.currentEpoch(spec);
    std::vector<ValidatorIndex> slashable;
    for (auto index : both) {
      auto validator = state.validator(index);
      if (validator == nullptr) {
        return E::UNKNOWN_VALIDATOR;
      }
      if (validator->isSlashableAt(current_epoch)
          and not already_slashed(index, *validator)) {
        slashable.emplace_back(index);
      }
    }
    if (slashable.empty()) {
      return E::NO_SLASHABLE_INDICES;
    }
    return slashable;
  }

  outcome::result<void> OperationVerifierImpl::verifyExitTimeIndependentOnly(
      const State &state,
      const SignedVoluntaryExit &exit,
      VerifySignatures verify_signatures,
      const ChainSpec &spec) const {
    return verifyExitParametric(state, exit, verify_signatures, true, spec);
  }

  outcome::result<void> OperationVerifierImpl::verifyExit(
      const State &state,
      const SignedVoluntaryExit &exit,
      VerifySignatures verify_signatures,
      const ChainSpec &spec) const {
    return verifyExitParametric(state, exit, verify_signatures, false, spec);
  }

  outcome::result<void> OperationVerifierImpl::verifyIndexedAttestation(
      const State &state,
      const IndexedAttestation &indexed_attestation,
      VerifySignatures verify_signatures,
      const ChainSpec &spec) const {
    using E = AttesterSlashingValidationError;
    auto &indices = indexed_attestation.attesting_indices.data();
    if (indices.empty()) {
      return E::INDICES_EMPTY;
    }
    // Strictly increasing
    if (std::ranges::adjacent_find(indices, std::greater_equal{})
        != indices.end()) {
      return E::INDICES_NOT_SORTED;
    }
    auto public_keys = publicKeys(state, indices);
    if (not public_keys) {
      return E::UNKNOWN_VALIDATOR;
    }
    if (verify_signatures == VerifySignatures::True) {
      auto &data = indexed_attestation.data;
      auto domain =
          getDomain(state, DOMAIN_BEACON_ATTESTER, data.target.epoch);
      auto signing_root = computeSigningRoot(data, domain);
      if (not bls_provider_->fastAggregateVerify(public_keys.value(),
                                                 signing_root,
                                                 indexed_attestation.signature)) {
        return E::BAD_SIGNATURE;
      }
    }
    return outcome::success();
  }

  outcome::result<void> OperationVerifierImpl::verifyExitParametric(
      const State &state,
      const SignedVoluntaryExit &exit,
      VerifySignatures verify_signatures,
      bool time_independent_only,
      const ChainSpec &spec) const {
    using E = ExitValidationError;
    auto &message = exit.message;
    auto current_epoch = state.currentEpoch(spec);

    auto validator = state.validator(message.validator_index);
    if (validator == nullptr) {
      return E::VALIDATOR_UNKNOWN;
    }
    if (not validator->isActiveAt(current_epoch)) {
      return E::NOT_ACTIVE;
    }
    if (validator->exit_epoch != FAR_FUTURE_EPOCH) {
      return E::ALREADY_EXITED;
    }

    // Future exits are kept in the pool until their epoch
    if (not time_independent_only and current_epoch < message.epoch) {
      return E::FUTURE_EPOCH;
    }
    if (current_epoch
        < validator->activation_epoch + spec.shard_committee_period) {
      return E::TOO_YOUNG_TO_EXIT;
    }

    if (verify_signatures == VerifySignatures::True) {
      auto domain = getDomain(state, DOMAIN_VOLUNTARY_EXIT, message.epoch);
      auto signing_root = computeSigningRoot(message, domain);
      if (not bls_provider_->verify(
              validator->pubkey, signing_root, exit.signature)) {
        return E::BAD_SIGNATURE;
      }
    }
    return outcome::success();
  }

}  // namespace oppool::state_processing
