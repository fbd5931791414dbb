/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>

#include <qtils/byte_vec.hpp>

#include "types/attestation_data.hpp"
#include "types/chain_spec.hpp"
#include "types/fork.hpp"
#include "types/state.hpp"

namespace oppool::op_pool {

  /**
   * Key of attestations that may be aggregated together.
   * Serialized attestation data followed by the attester domain of its
   * target epoch, so equal data signed under different forks never collide.
   */
  struct AttestationId {
    static AttestationId fromData(const AttestationData &data,
                                  const State &state,
                                  const ChainSpec &spec);

    static Domain computeDomainBytes(Epoch epoch,
                                     const State &state,
                                     const ChainSpec &spec);

    bool domainBytesMatch(const Domain &domain) const;

    bool operator==(const AttestationId &other) const {
      return std::ranges::equal(bytes, other.bytes);
    }

    bool operator<(const AttestationId &other) const {
      return std::ranges::lexicographical_compare(bytes, other.bytes);
    }

    qtils::ByteVec bytes;
  };

}  // namespace oppool::op_pool
