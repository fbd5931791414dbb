/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>
#include <sszpp/lists.hpp>

#include "types/attestation_data.hpp"
#include "types/constants.hpp"
#include "types/signature.hpp"
#include "types/validator_index.hpp"

namespace oppool {
  /**
   * Attestation with explicit, sorted signer indices.
   */
  struct IndexedAttestation : ssz::ssz_variable_size_container {
    ssz::list<ValidatorIndex, MAX_VALIDATORS_PER_COMMITTEE> attesting_indices;
    AttestationData data;
    BlsSignature signature;

    SSZ_CONT(attesting_indices, data, signature);
    bool operator==(const IndexedAttestation &) const = default;
  };
}  // namespace oppool
