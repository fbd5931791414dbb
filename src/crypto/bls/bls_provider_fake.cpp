/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bls/bls_provider_fake.hpp"

#include <algorithm>
#include <random>

#include <boost/container_hash/hash.hpp>
#include <qtils/bytes_std_hash.hpp>

namespace oppool::crypto::bls {
  namespace {
    void xorInto(BlsSignature &acc, const BlsSignature &other) {
      for (size_t i = 0; i < acc.size(); ++i) {
        acc[i] ^= other[i];
      }
    }
  }  // namespace

  BlsSignature BlsProviderFake::sign(const BlsPublicKey &public_key,
                                     qtils::BytesIn message) {
    size_t seed = qtils::BytesStdHash{}(public_key);
    boost::hash_combine(seed, qtils::BytesStdHash{}(message));
    BlsSignature signature;
    std::independent_bits_engine<std::default_random_engine, 8, uint8_t> random(
        static_cast<uint32_t>(seed));
    std::ranges::generate(signature, random);
    return signature;
  }

  outcome::result<BlsSignature> BlsProviderFake::aggregate(
      const BlsSignature &lhs, const BlsSignature &rhs) {
    auto result = lhs;
    xorInto(result, rhs);
    return result;
  }

  bool BlsProviderFake::verify(const BlsPublicKey &public_key,
                               qtils::BytesIn message,
                               const BlsSignature &signature) {
    return signature == sign(public_key, message);
  }

  bool BlsProviderFake::fastAggregateVerify(
      std::span<const BlsPublicKey> public_keys,
      qtils::BytesIn message,
      const BlsSignature &signature) {
    if (public_keys.empty()) {
      return false;
    }
    BlsSignature expected;
    expected.fill(0);
    for (auto &public_key : public_keys) {
      xorInto(expected, sign(public_key, message));
    }
    return signature == expected;
  }
}  // namespace oppool::crypto::bls
