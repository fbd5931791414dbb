/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "op_pool/persistence.hpp"

#include <algorithm>

#include "op_pool/operation_pool_error.hpp"
#include "serde/serialization.hpp"
#include "serde/snappy.hpp"

namespace oppool::op_pool {

  namespace {
    /// Upper bound of uncompressed snapshot size
    constexpr size_t kMaxSnapshotSize = size_t{1} << 30;

    PersistedAttestationId persistId(const AttestationId &id) {
      PersistedAttestationId persisted;
      persisted.data().assign(id.bytes.begin(), id.bytes.end());
      return persisted;
    }

    AttestationId restoreId(const PersistedAttestationId &persisted) {
      AttestationId id;
      id.bytes.assign(persisted.data().begin(), persisted.data().end());
      return id;
    }

    /// Key bytes start with the encoding of `data`, followed by a domain
    bool isKeyOf(const AttestationId &id, const AttestationData &data) {
      auto data_bytes = encode(data);
      return id.bytes.size() == data_bytes.size() + Domain{}.size()
         and std::equal(data_bytes.begin(), data_bytes.end(), id.bytes.begin());
    }

    /// Bucket entries must share the data the key was computed from
    bool isConsistentBucket(const AttestationId &id,
                            const std::vector<Attestation> &bucket) {
      if (bucket.empty()) {
        return false;
      }
      auto &data = bucket.front().data;
      if (not isKeyOf(id, data)) {
        return false;
      }
      return std::ranges::all_of(bucket, [&](const Attestation &attestation) {
        return attestation.data == data;
      });
    }
  }  // namespace

  outcome::result<PersistedOperationPool>
  PersistedOperationPool::fromOperationPool(const OperationPool &pool) {
    PersistedOperationPool persisted;

    OUTCOME_TRY(pool.attestations_.sharedAccess(
        [&](const OperationPool::AttestationBuckets &buckets)
            -> outcome::result<void> {
          if (buckets.size() > MAX_PERSISTED_ATTESTATION_BUCKETS) {
            return OperationPoolError::SNAPSHOT_TOO_LARGE;
          }
          for (auto &[id, bucket] : buckets) {
            if (bucket.size() > MAX_PERSISTED_BUCKET_SIZE) {
              return OperationPoolError::SNAPSHOT_TOO_LARGE;
            }
            PersistedAttestationBucket persisted_bucket;
            persisted_bucket.id = persistId(id);
            persisted_bucket.attestations.data().assign(bucket.begin(),
                                                        bucket.end());
            persisted.attestations.push_back(std::move(persisted_bucket));
          }
          return outcome::success();
        }));

    OUTCOME_TRY(pool.attester_slashings_.sharedAccess(
        [&](const OperationPool::AttesterSlashings &slashings)
            -> outcome::result<void> {
          if (slashings.size() > MAX_PERSISTED_ATTESTER_SLASHINGS) {
            return OperationPoolError::SNAPSHOT_TOO_LARGE;
          }
          for (auto &[id, slashing] : slashings) {
            persisted.attester_slashings.push_back(PersistedAttesterSlashing{
                .id_1 = persistId(id.first),
                .id_2 = persistId(id.second),
                .slashing = slashing,
            });
          }
          return outcome::success();
        }));

    // Keyed by validator index, so bounded by the registry size
    pool.proposer_slashings_.sharedAccess(
        [&](const OperationPool::ProposerSlashings &slashings) {
          for (auto &[_, slashing] : slashings) {
            persisted.proposer_slashings.push_back(slashing);
          }
        });

    pool.voluntary_exits_.sharedAccess(
        [&](const OperationPool::VoluntaryExits &exits) {
          for (auto &[_, exit] : exits) {
            persisted.voluntary_exits.push_back(exit);
          }
        });

    return persisted;
  }

  outcome::result<std::shared_ptr<OperationPool>>
  PersistedOperationPool::intoOperationPool(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<state_processing::OperationVerifier> verifier,
      qtils::SharedRef<crypto::bls::BlsProvider> bls_provider) const {
    if (version != kPersistedOperationPoolVersion) {
      return OperationPoolError::UNSUPPORTED_SNAPSHOT_VERSION;
    }

    // Stores are restored aside and moved in only when all are consistent
    OperationPool::AttestationBuckets buckets;
    for (auto &persisted_bucket : attestations.data()) {
      auto id = restoreId(persisted_bucket.id);
      auto &bucket = persisted_bucket.attestations.data();
      if (not isConsistentBucket(id, bucket)) {
        return OperationPoolError::CORRUPTED_SNAPSHOT;
      }
      if (not buckets.emplace(std::move(id), bucket).second) {
        return OperationPoolError::CORRUPTED_SNAPSHOT;
      }
    }

    OperationPool::AttesterSlashings restored_attester_slashings;
    for (auto &persisted_slashing : attester_slashings.data()) {
      OperationPool::AttesterSlashingId id{
          restoreId(persisted_slashing.id_1),
          restoreId(persisted_slashing.id_2),
      };
      auto &slashing = persisted_slashing.slashing;
      if (not isKeyOf(id.first, slashing.attestation_1.data)
          or not isKeyOf(id.second, slashing.attestation_2.data)) {
        return OperationPoolError::CORRUPTED_SNAPSHOT;
      }
      if (not restored_attester_slashings.emplace(std::move(id), slashing)
                  .second) {
        return OperationPoolError::CORRUPTED_SNAPSHOT;
      }
    }

    OperationPool::ProposerSlashings restored_proposer_slashings;
    for (auto &slashing : proposer_slashings.data()) {
      if (not restored_proposer_slashings
                  .emplace(slashing.proposerIndex(), slashing)
                  .second) {
        return OperationPoolError::CORRUPTED_SNAPSHOT;
      }
    }

    OperationPool::VoluntaryExits restored_exits;
    for (auto &exit : voluntary_exits.data()) {
      if (not restored_exits.emplace(exit.message.validator_index, exit)
                  .second) {
        return OperationPoolError::CORRUPTED_SNAPSHOT;
      }
    }

    auto pool = std::make_shared<OperationPool>(
        std::move(logsys), std::move(verifier), std::move(bls_provider));
    pool->attestations_.exclusiveAccess(
        [&](OperationPool::AttestationBuckets &store) {
          store = std::move(buckets);
        });
    pool->attester_slashings_.exclusiveAccess(
        [&](OperationPool::AttesterSlashings &store) {
          store = std::move(restored_attester_slashings);
        });
    pool->proposer_slashings_.exclusiveAccess(
        [&](OperationPool::ProposerSlashings &store) {
          store = std::move(restored_proposer_slashings);
        });
    pool->voluntary_exits_.exclusiveAccess(
        [&](OperationPool::VoluntaryExits &store) {
          store = std::move(restored_exits);
        });
    SL_INFO(pool->logger_,
            "Restored operation pool: {} attestations, {} proposer slashings, "
            "{} attester slashings, {} voluntary exits",
            pool->numAttestations(),
            pool->numProposerSlashings(),
            pool->numAttesterSlashings(),
            pool->numVoluntaryExits());
    return pool;
  }

  outcome::result<qtils::ByteVec> encodeOperationPool(
      const OperationPool &pool) {
    OUTCOME_TRY(persisted, PersistedOperationPool::fromOperationPool(pool));
    return snappyCompress(encode(persisted));
  }

  outcome::result<std::shared_ptr<OperationPool>> decodeOperationPool(
      qtils::BytesIn bytes,
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<state_processing::OperationVerifier> verifier,
      qtils::SharedRef<crypto::bls::BlsProvider> bls_provider) {
    auto uncompressed_res = snappyUncompress(bytes, kMaxSnapshotSize);
    if (uncompressed_res.has_error()) {
      return OperationPoolError::SNAPSHOT_DECODE_FAILED;
    }
    auto persisted_res =
        decode<PersistedOperationPool>(uncompressed_res.value());
    if (persisted_res.has_error()) {
      return OperationPoolError::SNAPSHOT_DECODE_FAILED;
    }
    return persisted_res.value().intoOperationPool(
        std::move(logsys), std::move(verifier), std::move(bls_provider));
  }

}  // namespace oppool::op_pool
