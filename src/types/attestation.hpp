/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>

#include "types/aggregation_bits.hpp"
#include "types/attestation_data.hpp"
#include "types/signature.hpp"

namespace oppool {
  struct Attestation : ssz::ssz_variable_size_container {
    AggregationBits aggregation_bits;
    AttestationData data;
    BlsSignature signature;

    SSZ_CONT(aggregation_bits, data, signature);
    bool operator==(const Attestation &) const = default;

    bool signersDisjointFrom(const Attestation &other) const {
      return aggregation_bits.isDisjoint(other.aggregation_bits);
    }
  };
}  // namespace oppool
