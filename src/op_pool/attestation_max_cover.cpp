/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "op_pool/attestation_max_cover.hpp"

namespace oppool::op_pool {

  AttestationMaxCover::AttestationMaxCover(const Attestation &attestation,
                                           AggregationBits fresh_validators)
      : attestation_(&attestation),
        fresh_validators_(std::move(fresh_validators)) {}

  void AttestationMaxCover::updateCoveringSet(const Attestation &best,
                                              const AggregationBits &covered) {
    // Committees of other slots are disjoint from ours
    if (attestation_->data.slot == best.data.slot
        and attestation_->data.index == best.data.index) {
      fresh_validators_.subtract(covered);
    }
  }

  AggregationBits earliestAttestationValidators(const Attestation &attestation,
                                                const State &state,
                                                const ChainSpec &spec) {
    auto target_epoch = attestation.data.target.epoch;
    const PendingAttestations *recorded = nullptr;
    if (target_epoch == state.currentEpoch(spec)) {
      recorded = &state.current_epoch_attestations;
    } else if (target_epoch == state.previousEpoch(spec)) {
      recorded = &state.previous_epoch_attestations;
    } else {
      return AggregationBits{};
    }

    auto fresh_validators = attestation.aggregation_bits;
    for (auto &pending : recorded->data()) {
      if (pending.data.slot == attestation.data.slot
          and pending.data.index == attestation.data.index) {
        fresh_validators.subtract(pending.aggregation_bits);
      }
    }
    return fresh_validators;
  }

}  // namespace oppool::op_pool
