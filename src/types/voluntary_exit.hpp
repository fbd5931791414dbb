/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>

#include "types/signature.hpp"
#include "types/slot.hpp"
#include "types/validator_index.hpp"

namespace oppool {
  struct VoluntaryExit : ssz::ssz_container {
    /// Earliest epoch when voluntary exit can be processed
    Epoch epoch = 0;
    ValidatorIndex validator_index = 0;

    SSZ_CONT(epoch, validator_index);
    bool operator==(const VoluntaryExit &) const = default;
  };

  struct SignedVoluntaryExit : ssz::ssz_container {
    VoluntaryExit message;
    BlsSignature signature;

    SSZ_CONT(message, signature);
    bool operator==(const SignedVoluntaryExit &) const = default;
  };
}  // namespace oppool
