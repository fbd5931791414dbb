/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bls/bls_provider_impl.hpp"

#include <optional>
#include <string_view>

#include <blst.h>

namespace oppool::crypto::bls {
  namespace {
    constexpr std::string_view kDst =
        "BLS_SIG_BLS12381G2_XMD:SHA-256_SSWU_RO_POP_";

    std::optional<blst_p2_affine> decodeSignature(
        const BlsSignature &signature) {
      blst_p2_affine point;
      if (blst_p2_uncompress(&point, signature.data()) != BLST_SUCCESS) {
        return std::nullopt;
      }
      if (not blst_p2_affine_in_g2(&point)) {
        return std::nullopt;
      }
      return point;
    }

    std::optional<blst_p1_affine> decodePublicKey(
        const BlsPublicKey &public_key) {
      blst_p1_affine point;
      if (blst_p1_uncompress(&point, public_key.data()) != BLST_SUCCESS) {
        return std::nullopt;
      }
      // Infinity public key is rejected by KeyValidate
      if (blst_p1_affine_is_inf(&point) or not blst_p1_affine_in_g1(&point)) {
        return std::nullopt;
      }
      return point;
    }

    bool coreVerify(const blst_p1_affine &public_key,
                    qtils::BytesIn message,
                    const blst_p2_affine &signature) {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      auto dst = reinterpret_cast<const byte *>(kDst.data());
      return blst_core_verify_pk_in_g1(&public_key,
                                       &signature,
                                       true,
                                       message.data(),
                                       message.size(),
                                       dst,
                                       kDst.size(),
                                       nullptr,
                                       0)
          == BLST_SUCCESS;
    }
  }  // namespace

  outcome::result<BlsSignature> BlsProviderImpl::aggregate(
      const BlsSignature &lhs, const BlsSignature &rhs) {
    auto lhs_point = decodeSignature(lhs);
    auto rhs_point = decodeSignature(rhs);
    if (not lhs_point or not rhs_point) {
      return BlsError::INVALID_SIGNATURE;
    }
    blst_p2 sum;
    blst_p2_from_affine(&sum, &lhs_point.value());
    blst_p2_add_or_double_affine(&sum, &sum, &rhs_point.value());
    BlsSignature result;
    blst_p2_compress(result.data(), &sum);
    return result;
  }

  bool BlsProviderImpl::verify(const BlsPublicKey &public_key,
                               qtils::BytesIn message,
                               const BlsSignature &signature) {
    auto key_point = decodePublicKey(public_key);
    auto signature_point = decodeSignature(signature);
    if (not key_point or not signature_point) {
      return false;
    }
    return coreVerify(key_point.value(), message, signature_point.value());
  }

  bool BlsProviderImpl::fastAggregateVerify(
      std::span<const BlsPublicKey> public_keys,
      qtils::BytesIn message,
      const BlsSignature &signature) {
    if (public_keys.empty()) {
      return false;
    }
    auto signature_point = decodeSignature(signature);
    if (not signature_point) {
      return false;
    }

    blst_p1 aggregated_key;
    bool first = true;
    for (auto &public_key : public_keys) {
      auto key_point = decodePublicKey(public_key);
      if (not key_point) {
        return false;
      }
      if (first) {
        blst_p1_from_affine(&aggregated_key, &key_point.value());
        first = false;
      } else {
        blst_p1_add_or_double_affine(
            &aggregated_key, &aggregated_key, &key_point.value());
      }
    }
    blst_p1_affine aggregated_affine;
    blst_p1_to_affine(&aggregated_affine, &aggregated_key);

    return coreVerify(aggregated_affine, message, signature_point.value());
  }
}  // namespace oppool::crypto::bls
