/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>

#include "types/checkpoint.hpp"

namespace oppool {
  using CommitteeIndex = uint64_t;

  /**
   * The vote payload: what an attestation attests to.
   */
  struct AttestationData : ssz::ssz_container {
    Slot slot = 0;
    CommitteeIndex index = 0;
    /// LMD GHOST vote
    Root beacon_block_root;
    /// FFG vote
    Checkpoint source;
    Checkpoint target;

    SSZ_CONT(slot, index, beacon_block_root, source, target);
    bool operator==(const AttestationData &) const = default;
  };
}  // namespace oppool
