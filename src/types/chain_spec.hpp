/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "types/slot.hpp"

namespace oppool {
  /**
   * Per-block operation maxima and epoch timing.
   */
  struct ChainSpec {
    uint64_t slots_per_epoch = 32;
    Slot min_attestation_inclusion_delay = 1;
    /// Epochs a validator must be active before it may exit
    Epoch shard_committee_period = 256;

    uint64_t max_proposer_slashings = 16;
    uint64_t max_attester_slashings = 2;
    uint64_t max_attestations = 128;
    uint64_t max_voluntary_exits = 16;

    bool operator==(const ChainSpec &) const = default;

    static ChainSpec mainnet() {
      return ChainSpec{};
    }

    static ChainSpec minimal() {
      return ChainSpec{
          .slots_per_epoch = 8,
          .shard_committee_period = 64,
      };
    }

    Epoch epochAtSlot(Slot slot) const {
      return slot / slots_per_epoch;
    }

    Slot startSlot(Epoch epoch) const {
      return epoch * slots_per_epoch;
    }
  };
}  // namespace oppool
