/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>
#include <sszpp/lists.hpp>

#include "types/aggregation_bits.hpp"
#include "types/attestation_data.hpp"
#include "types/constants.hpp"

namespace oppool {
  /**
   * Attestation already included on chain and recorded in the state.
   */
  struct PendingAttestation : ssz::ssz_variable_size_container {
    AggregationBits aggregation_bits;
    AttestationData data;
    Slot inclusion_delay = 0;
    ValidatorIndex proposer_index = 0;

    SSZ_CONT(aggregation_bits, data, inclusion_delay, proposer_index);
    bool operator==(const PendingAttestation &) const = default;
  };

  using PendingAttestations =
      ssz::list<PendingAttestation, MAX_PENDING_ATTESTATIONS>;
}  // namespace oppool
