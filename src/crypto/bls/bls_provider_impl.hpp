/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/bls/bls_provider.hpp"

namespace oppool::crypto::bls {
  /**
   * BLS12-381 min-pubkey-size scheme (public keys in G1, signatures in G2)
   * with the proof-of-possession ciphersuite, backed by blst.
   */
  class BlsProviderImpl : public BlsProvider {
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
  };
}  // namespace oppool::crypto::bls
