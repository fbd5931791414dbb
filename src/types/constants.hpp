/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <limits>

#include <qtils/byte_arr.hpp>

namespace oppool {

  using DomainType = qtils::ByteArr<4>;

  static constexpr uint64_t FAR_FUTURE_EPOCH =
      std::numeric_limits<uint64_t>::max();

  // State list lengths

  static constexpr uint64_t VALIDATOR_REGISTRY_LIMIT = 1 << 22;  // 4'194'304
  static constexpr uint64_t MAX_VALIDATORS_PER_COMMITTEE = 1 << 11;  // 2'048
  static constexpr uint64_t MAX_PENDING_ATTESTATIONS = 1 << 12;  // 128 * 32

  // Persisted pool list lengths

  static constexpr uint64_t MAX_PERSISTED_ATTESTATION_BUCKETS = 1 << 22;
  static constexpr uint64_t MAX_PERSISTED_BUCKET_SIZE = 1 << 10;
  static constexpr uint64_t MAX_PERSISTED_ATTESTER_SLASHINGS = 1 << 22;
  /// Stores keyed by validator index hold one entry per validator
  static constexpr uint64_t MAX_PERSISTED_PROPOSER_SLASHINGS =
      VALIDATOR_REGISTRY_LIMIT;
  static constexpr uint64_t MAX_PERSISTED_EXITS = VALIDATOR_REGISTRY_LIMIT;
  /// Encoded attestation data (128 bytes) plus a 32-byte domain
  static constexpr uint64_t MAX_ATTESTATION_ID_LENGTH = 1 << 8;

  // Signature domains

  inline DomainType makeDomainType(uint8_t type) {
    DomainType domain_type;
    domain_type.fill(0);
    domain_type[0] = type;
    return domain_type;
  }

  inline const DomainType DOMAIN_BEACON_PROPOSER = makeDomainType(0);
  inline const DomainType DOMAIN_BEACON_ATTESTER = makeDomainType(1);
  inline const DomainType DOMAIN_VOLUNTARY_EXIT = makeDomainType(4);

}  // namespace oppool
