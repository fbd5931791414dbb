/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "op_pool/attestation_id.hpp"

#include "serde/serialization.hpp"
#include "state_processing/signing_root.hpp"

namespace oppool::op_pool {

  AttestationId AttestationId::fromData(const AttestationData &data,
                                        const State &state,
                                        const ChainSpec &spec) {
    AttestationId id{.bytes = encode(data)};
    auto domain = computeDomainBytes(data.target.epoch, state, spec);
    id.bytes.insert(id.bytes.end(), domain.begin(), domain.end());
    return id;
  }

  Domain AttestationId::computeDomainBytes(Epoch epoch,
                                           const State &state,
                                           const ChainSpec &) {
    return state_processing::getDomain(state, DOMAIN_BEACON_ATTESTER, epoch);
  }

  bool AttestationId::domainBytesMatch(const Domain &domain) const {
    if (bytes.size() < domain.size()) {
      return false;
    }
    return std::equal(bytes.end() - domain.size(), bytes.end(), domain.begin());
  }

}  // namespace oppool::op_pool
