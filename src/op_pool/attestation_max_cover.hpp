/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "types/attestation.hpp"
#include "types/chain_spec.hpp"
#include "types/state.hpp"

namespace oppool::op_pool {

  /**
   * Attestation candidate of `maximumCover`.
   * Covers validators not yet credited for the same slot and committee.
   */
  class AttestationMaxCover {
   public:
    using Object = Attestation;
    using CoveringSet = AggregationBits;

    AttestationMaxCover(const Attestation &attestation,
                        AggregationBits fresh_validators);

    const Attestation &object() const {
      return *attestation_;
    }

    const AggregationBits &coveringSet() const {
      return fresh_validators_;
    }

    void updateCoveringSet(const Attestation &best,
                           const AggregationBits &covered);

    size_t score() const {
      return fresh_validators_.count();
    }

   private:
    const Attestation *attestation_;
    AggregationBits fresh_validators_;
  };

  /**
   * Signers of `attestation` whose vote for the same slot and committee is
   * not yet recorded in `state`.
   */
  AggregationBits earliestAttestationValidators(const Attestation &attestation,
                                                const State &state,
                                                const ChainSpec &spec);

}  // namespace oppool::op_pool
