/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <initializer_list>
#include <ranges>
#include <vector>

#include "crypto/bls/bls_provider_fake.hpp"
#include "state_processing/signing_root.hpp"
#include "types/attestation.hpp"
#include "types/attester_slashing.hpp"
#include "types/proposer_slashing.hpp"
#include "types/state.hpp"
#include "types/voluntary_exit.hpp"

/**
 * Builders of states and operations signed with `BlsProviderFake`.
 */
namespace testutil {
  using oppool::Attestation;
  using oppool::AttestationData;
  using oppool::AttesterSlashing;
  using oppool::BlsPublicKey;
  using oppool::BlsSignature;
  using oppool::ChainSpec;
  using oppool::CommitteeIndex;
  using oppool::Epoch;
  using oppool::IndexedAttestation;
  using oppool::ProposerSlashing;
  using oppool::SignedBeaconBlockHeader;
  using oppool::SignedVoluntaryExit;
  using oppool::Slot;
  using oppool::State;
  using oppool::ValidatorIndex;
  using oppool::crypto::bls::BlsProviderFake;

  inline BlsPublicKey validatorPubkey(ValidatorIndex index) {
    BlsPublicKey pubkey;
    pubkey.fill(0);
    for (size_t i = 0; i < sizeof(index); ++i) {
      pubkey[i] = static_cast<uint8_t>(index >> (8 * i));
    }
    pubkey.back() = 0xaa;
    return pubkey;
  }

  /// Fork version with the given first byte
  inline oppool::Version makeVersion(uint8_t first) {
    oppool::Version version;
    version.fill(0);
    version[0] = first;
    return version;
  }

  inline oppool::Root makeRoot(uint8_t byte) {
    oppool::Root root;
    root.fill(byte);
    return root;
  }

  /**
   * State at `slot` with `num_validators` validators active since genesis.
   * Justified checkpoints are set to the previous and current epoch.
   */
  inline State makeState(size_t num_validators,
                         Slot slot,
                         const ChainSpec &spec) {
    State state;
    state.genesis_validators_root = makeRoot(0x11);
    state.slot = slot;
    state.fork.previous_version = makeVersion(0);
    state.fork.current_version = makeVersion(1);
    state.fork.epoch = 0;
    for (ValidatorIndex index = 0; index < num_validators; ++index) {
      oppool::Validator validator;
      validator.pubkey = validatorPubkey(index);
      validator.withdrawal_credentials = makeRoot(0x01);
      validator.effective_balance = 32'000'000'000;
      validator.activation_eligibility_epoch = 0;
      validator.activation_epoch = 0;
      state.validators.push_back(validator);
    }
    state.previous_justified_checkpoint = {
        .epoch = state.previousEpoch(spec),
        .root = makeRoot(0x22),
    };
    state.current_justified_checkpoint = {
        .epoch = state.currentEpoch(spec),
        .root = makeRoot(0x23),
    };
    return state;
  }

  /// Vote for `slot` with the source `state` expects
  inline AttestationData makeAttestationData(const State &state,
                                             Slot slot,
                                             CommitteeIndex index,
                                             const ChainSpec &spec) {
    AttestationData data;
    data.slot = slot;
    data.index = index;
    data.beacon_block_root = makeRoot(0x33);
    data.target = {
        .epoch = spec.epochAtSlot(slot),
        .root = makeRoot(0x34),
    };
    data.source = data.target.epoch == state.currentEpoch(spec)
                    ? state.current_justified_checkpoint
                    : state.previous_justified_checkpoint;
    return data;
  }

  inline oppool::Root attestationSigningRoot(const State &state,
                                             const AttestationData &data) {
    using namespace oppool::state_processing;
    return computeSigningRoot(
        data,
        getDomain(state, oppool::DOMAIN_BEACON_ATTESTER, data.target.epoch));
  }

  /// Xor of fake signatures of `signers`, that is their fake aggregate
  inline BlsSignature aggregateSign(const State &state,
                                    auto &&signers,
                                    const oppool::Root &signing_root) {
    BlsSignature signature;
    signature.fill(0);
    for (ValidatorIndex signer : signers) {
      auto single = BlsProviderFake::sign(state.validators.data()[signer].pubkey,
                                          signing_root);
      for (size_t i = 0; i < signature.size(); ++i) {
        signature[i] ^= single[i];
      }
    }
    return signature;
  }

  inline Attestation signedAttestation(const State &state,
                                       const AttestationData &data,
                                       const std::vector<ValidatorIndex> &signers) {
    Attestation attestation;
    attestation.data = data;
    for (auto signer : signers) {
      attestation.aggregation_bits.add(signer);
    }
    attestation.signature =
        aggregateSign(state, signers, attestationSigningRoot(state, data));
    return attestation;
  }

  /// Signed by validators in [begin, end)
  inline Attestation signedAttestation(const State &state,
                                       const AttestationData &data,
                                       ValidatorIndex begin,
                                       ValidatorIndex end) {
    std::vector<ValidatorIndex> signers;
    for (auto index = begin; index < end; ++index) {
      signers.emplace_back(index);
    }
    return signedAttestation(state, data, signers);
  }

  inline SignedBeaconBlockHeader signedHeader(const State &state,
                                              Slot slot,
                                              ValidatorIndex proposer,
                                              uint8_t body,
                                              const ChainSpec &spec) {
    using namespace oppool::state_processing;
    SignedBeaconBlockHeader signed_header;
    signed_header.message.slot = slot;
    signed_header.message.proposer_index = proposer;
    signed_header.message.parent_root = makeRoot(0x41);
    signed_header.message.state_root = makeRoot(0x42);
    signed_header.message.body_root = makeRoot(body);
    auto domain = getDomain(
        state, oppool::DOMAIN_BEACON_PROPOSER, spec.epochAtSlot(slot));
    signed_header.signature = BlsProviderFake::sign(
        state.validators.data()[proposer].pubkey,
        computeSigningRoot(signed_header.message, domain));
    return signed_header;
  }

  inline ProposerSlashing proposerSlashing(const State &state,
                                           ValidatorIndex proposer,
                                           const ChainSpec &spec) {
    auto slot = state.slot - 1;
    return ProposerSlashing{
        .signed_header_1 = signedHeader(state, slot, proposer, 0x51, spec),
        .signed_header_2 = signedHeader(state, slot, proposer, 0x52, spec),
    };
  }

  inline IndexedAttestation indexedAttestation(
      const State &state,
      const AttestationData &data,
      const std::vector<ValidatorIndex> &indices) {
    IndexedAttestation indexed;
    indexed.data = data;
    indexed.attesting_indices.data().assign(indices.begin(), indices.end());
    indexed.signature =
        aggregateSign(state, indices, attestationSigningRoot(state, data));
    return indexed;
  }

  /**
   * Double vote of `indices` at `slot`: same target, different block roots.
   */
  inline AttesterSlashing attesterSlashing(
      const State &state,
      Slot slot,
      const std::vector<ValidatorIndex> &indices,
      const ChainSpec &spec) {
    auto data_1 = makeAttestationData(state, slot, 0, spec);
    auto data_2 = data_1;
    data_2.beacon_block_root = makeRoot(0x35);
    return AttesterSlashing{
        .attestation_1 = indexedAttestation(state, data_1, indices),
        .attestation_2 = indexedAttestation(state, data_2, indices),
    };
  }

  inline SignedVoluntaryExit signedExit(const State &state,
                                        ValidatorIndex validator_index,
                                        Epoch epoch) {
    using namespace oppool::state_processing;
    SignedVoluntaryExit exit;
    exit.message.epoch = epoch;
    exit.message.validator_index = validator_index;
    auto domain = getDomain(state, oppool::DOMAIN_VOLUNTARY_EXIT, epoch);
    exit.signature =
        BlsProviderFake::sign(state.validators.data()[validator_index].pubkey,
                              computeSigningRoot(exit.message, domain));
    return exit;
  }
}  // namespace testutil
