/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>

#include "types/indexed_attestation.hpp"

namespace oppool {
  /**
   * Two conflicting attestations (double vote or surround vote).
   */
  struct AttesterSlashing : ssz::ssz_variable_size_container {
    IndexedAttestation attestation_1;
    IndexedAttestation attestation_2;

    SSZ_CONT(attestation_1, attestation_2);
    bool operator==(const AttesterSlashing &) const = default;
  };
}  // namespace oppool
