/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>
#include <sszpp/lists.hpp>

#include "types/constants.hpp"
#include "types/hash.hpp"
#include "types/signature.hpp"
#include "types/slot.hpp"

namespace oppool {
  struct Validator : ssz::ssz_container {
    BlsPublicKey pubkey;
    Hash withdrawal_credentials;
    Gwei effective_balance = 0;
    bool slashed = false;
    Epoch activation_eligibility_epoch = FAR_FUTURE_EPOCH;
    Epoch activation_epoch = FAR_FUTURE_EPOCH;
    Epoch exit_epoch = FAR_FUTURE_EPOCH;
    Epoch withdrawable_epoch = FAR_FUTURE_EPOCH;

    SSZ_CONT(pubkey,
             withdrawal_credentials,
             effective_balance,
             slashed,
             activation_eligibility_epoch,
             activation_epoch,
             exit_epoch,
             withdrawable_epoch);
    bool operator==(const Validator &) const = default;

    bool isActiveAt(Epoch epoch) const {
      return activation_epoch <= epoch and epoch < exit_epoch;
    }

    bool isExitedAt(Epoch epoch) const {
      return exit_epoch <= epoch;
    }

    bool isWithdrawableAt(Epoch epoch) const {
      return withdrawable_epoch <= epoch;
    }

    bool isSlashableAt(Epoch epoch) const {
      return not slashed and activation_epoch <= epoch
         and epoch < withdrawable_epoch;
    }
  };

  using Validators = ssz::list<Validator, VALIDATOR_REGISTRY_LIMIT>;
}  // namespace oppool
