/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_arr.hpp>
#include <sszpp/container.hpp>

#include "types/hash.hpp"
#include "types/slot.hpp"

namespace oppool {
  using Version = qtils::ByteArr<4>;
  using Domain = qtils::ByteArr<32>;

  struct Fork : ssz::ssz_container {
    Version previous_version;
    Version current_version;
    /// Epoch of the latest fork
    Epoch epoch = 0;

    SSZ_CONT(previous_version, current_version, epoch);
    bool operator==(const Fork &) const = default;

    const Version &versionAt(Epoch at) const {
      return at < epoch ? previous_version : current_version;
    }
  };

  struct ForkData : ssz::ssz_container {
    Version current_version;
    Root genesis_validators_root;

    SSZ_CONT(current_version, genesis_validators_root);
  };

  struct SigningData : ssz::ssz_container {
    Root object_root;
    Domain domain;

    SSZ_CONT(object_root, domain);
  };
}  // namespace oppool
