/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>

#include "types/block_header.hpp"

namespace oppool {
  /**
   * Two different headers signed by one proposer for the same slot.
   */
  struct ProposerSlashing : ssz::ssz_container {
    SignedBeaconBlockHeader signed_header_1;
    SignedBeaconBlockHeader signed_header_2;

    SSZ_CONT(signed_header_1, signed_header_2);
    bool operator==(const ProposerSlashing &) const = default;

    ValidatorIndex proposerIndex() const {
      return signed_header_1.message.proposer_index;
    }
  };
}  // namespace oppool
