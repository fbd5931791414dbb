/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>

#include <qtils/bytes.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "types/signature.hpp"

namespace oppool::crypto::bls {
  enum class BlsError {
    INVALID_SIGNATURE,
  };
  Q_ENUM_ERROR_CODE(BlsError) {
    using E = decltype(e);
    switch (e) {
      case E::INVALID_SIGNATURE:
        return "Signature is not a valid compressed G2 point";
    }
    abort();
  }

  /**
   * Aggregate signature capability: point combination and verification.
   * Combination is associative and commutative.
   */
  class BlsProvider {
   public:
    virtual ~BlsProvider() = default;

    virtual outcome::result<BlsSignature> aggregate(
        const BlsSignature &lhs, const BlsSignature &rhs) = 0;

    virtual bool verify(const BlsPublicKey &public_key,
                        qtils::BytesIn message,
                        const BlsSignature &signature) = 0;

    /// Verifies a signature aggregated from signers of the same message
    virtual bool fastAggregateVerify(std::span<const BlsPublicKey> public_keys,
                                     qtils::BytesIn message,
                                     const BlsSignature &signature) = 0;
  };
}  // namespace oppool::crypto::bls
