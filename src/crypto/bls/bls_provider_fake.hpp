/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/bls/bls_provider.hpp"

namespace oppool::crypto::bls {
  /**
   * Fake bls provider implementation.
   * Used for tests and offline tooling.
   * `sign` returns pseudo-random `signature` seeded by `public_key` and
   * `message`. `aggregate` xors signatures, so aggregate of disjoint signers
   * verifies against the same signers set.
   */
  class BlsProviderFake : public BlsProvider {
   public:
    // BlsProvider
    outcome::result<BlsSignature> aggregate(const BlsSignature &lhs,
                                            const BlsSignature &rhs) override;
    bool verify(const BlsPublicKey &public_key,
                qtils::BytesIn message,
                const BlsSignature &signature) override;
    bool fastAggregateVerify(std::span<const BlsPublicKey> public_keys,
                             qtils::BytesIn message,
                             const BlsSignature &signature) override;

    static BlsSignature sign(const BlsPublicKey &public_key,
                             qtils::BytesIn message);
  };
}  // namespace oppool::crypto::bls
