/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>

#include "serde/serialization.hpp"
#include "types/constants.hpp"
#include "types/fork.hpp"
#include "types/state.hpp"

namespace oppool::state_processing {

  /**
   * Domain type followed by the first 28 bytes of the fork data root.
   */
  inline Domain computeDomain(const DomainType &domain_type,
                              const Version &fork_version,
                              const Root &genesis_validators_root) {
    ForkData fork_data;
    fork_data.current_version = fork_version;
    fork_data.genesis_validators_root = genesis_validators_root;
    auto fork_data_root = sszHash(fork_data);

    Domain domain;
    std::ranges::copy(domain_type, domain.begin());
    std::copy_n(fork_data_root.begin(),
                domain.size() - domain_type.size(),
                domain.begin() + domain_type.size());
    return domain;
  }

  /// Domain of `state` fork for messages of `epoch`
  inline Domain getDomain(const State &state,
                          const DomainType &domain_type,
                          Epoch epoch) {
    return computeDomain(domain_type,
                         state.fork.versionAt(epoch),
                         state.genesis_validators_root);
  }

  inline Root computeSigningRoot(const auto &object, const Domain &domain) {
    SigningData signing_data;
    signing_data.object_root = sszHash(object);
    signing_data.domain = domain;
    return sszHash(signing_data);
  }

}  // namespace oppool::state_processing
