/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>

#include "types/hash.hpp"
#include "types/signature.hpp"
#include "types/slot.hpp"
#include "types/validator_index.hpp"

namespace oppool {

  /**
   * @struct BeaconBlockHeader
   * Light version of the block, signed by the proposer.
   */
  struct BeaconBlockHeader : ssz::ssz_container {
    /// The block’s slot number
    Slot slot = 0;
    /// Index of the validator that proposed the block
    ValidatorIndex proposer_index = 0;
    /// Hash of the parent block
    Root parent_root;
    /// Hash of the post-state after the block is processed
    Root state_root;
    /// Hash of the block body
    Root body_root;

    SSZ_CONT(slot, proposer_index, parent_root, state_root, body_root);
    bool operator==(const BeaconBlockHeader &) const = default;
  };

  struct SignedBeaconBlockHeader : ssz::ssz_container {
    BeaconBlockHeader message;
    BlsSignature signature;

    SSZ_CONT(message, signature);
    bool operator==(const SignedBeaconBlockHeader &) const = default;
  };
}  // namespace oppool
