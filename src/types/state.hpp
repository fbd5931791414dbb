/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>

#include "types/chain_spec.hpp"
#include "types/checkpoint.hpp"
#include "types/fork.hpp"
#include "types/pending_attestation.hpp"
#include "types/validator.hpp"
#include "types/validator_index.hpp"

namespace oppool {
  /**
   * Reference state the pool validates and ranks operations against.
   */
  struct State : ssz::ssz_variable_size_container {
    Root genesis_validators_root;
    Slot slot = 0;
    Fork fork;

    Validators validators;

    PendingAttestations previous_epoch_attestations;
    PendingAttestations current_epoch_attestations;

    Checkpoint previous_justified_checkpoint;
    Checkpoint current_justified_checkpoint;
    Checkpoint finalized_checkpoint;

    SSZ_CONT(genesis_validators_root,
             slot,
             fork,
             validators,
             previous_epoch_attestations,
             current_epoch_attestations,
             previous_justified_checkpoint,
             current_justified_checkpoint,
             finalized_checkpoint);
    bool operator==(const State &) const = default;

    Epoch currentEpoch(const ChainSpec &spec) const {
      return spec.epochAtSlot(slot);
    }

    Epoch previousEpoch(const ChainSpec &spec) const {
      auto current = currentEpoch(spec);
      return current == 0 ? 0 : current - 1;
    }

    const Validator *validator(ValidatorIndex index) const {
      if (index >= validators.size()) {
        return nullptr;
      }
      return &validators.data()[index];
    }
  };
}  // namespace oppool
