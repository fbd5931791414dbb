/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <sszpp/container.hpp>
#include <sszpp/lists.hpp>

#include "op_pool/operation_pool.hpp"
#include "types/constants.hpp"

namespace oppool::op_pool {

  /// Snapshot format version
  constexpr uint64_t kPersistedOperationPoolVersion = 1;

  using PersistedAttestationId = ssz::list<uint8_t, MAX_ATTESTATION_ID_LENGTH>;

  struct PersistedAttestationBucket : ssz::ssz_variable_size_container {
    PersistedAttestationId id;
    ssz::list<Attestation, MAX_PERSISTED_BUCKET_SIZE> attestations;

    SSZ_CONT(id, attestations);
    bool operator==(const PersistedAttestationBucket &) const = default;
  };

  struct PersistedAttesterSlashing : ssz::ssz_variable_size_container {
    PersistedAttestationId id_1;
    PersistedAttestationId id_2;
    AttesterSlashing slashing;

    SSZ_CONT(id_1, id_2, slashing);
    bool operator==(const PersistedAttesterSlashing &) const = default;
  };

  /**
   * Content of all operation pool stores, as written to disk on shutdown.
   */
  struct PersistedOperationPool : ssz::ssz_variable_size_container {
    uint64_t version = kPersistedOperationPoolVersion;
    ssz::list<PersistedAttestationBucket, MAX_PERSISTED_ATTESTATION_BUCKETS>
        attestations;
    ssz::list<PersistedAttesterSlashing, MAX_PERSISTED_ATTESTER_SLASHINGS>
        attester_slashings;
    ssz::list<ProposerSlashing, MAX_PERSISTED_PROPOSER_SLASHINGS>
        proposer_slashings;
    ssz::list<SignedVoluntaryExit, MAX_PERSISTED_EXITS> voluntary_exits;

    SSZ_CONT(version,
             attestations,
             attester_slashings,
             proposer_slashings,
             voluntary_exits);
    bool operator==(const PersistedOperationPool &) const = default;

    /**
     * Snapshot of `pool`, reading each store under its own lock.
     * Fails with `SNAPSHOT_TOO_LARGE` when a store does not fit the lists
     * above, as such a snapshot could not be decoded back.
     */
    static outcome::result<PersistedOperationPool> fromOperationPool(
        const OperationPool &pool);

    /**
     * Rebuild the pool.
     * Fails on a structurally inconsistent snapshot without returning a
     * partially restored pool.
     */
    outcome::result<std::shared_ptr<OperationPool>> intoOperationPool(
        qtils::SharedRef<log::LoggingSystem> logsys,
        qtils::SharedRef<state_processing::OperationVerifier> verifier,
        qtils::SharedRef<crypto::bls::BlsProvider> bls_provider) const;
  };

  /// Snappy compressed ssz encoding of the pool snapshot
  outcome::result<qtils::ByteVec> encodeOperationPool(
      const OperationPool &pool);

  outcome::result<std::shared_ptr<OperationPool>> decodeOperationPool(
      qtils::BytesIn bytes,
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<state_processing::OperationVerifier> verifier,
      qtils::SharedRef<crypto::bls::BlsProvider> bls_provider);

}  // namespace oppool::op_pool
