/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "op_pool/operation_pool.hpp"

#include <numeric>

#include "crypto/bls/bls_provider.hpp"
#include "op_pool/attestation_max_cover.hpp"
#include "op_pool/max_cover.hpp"
#include "op_pool/operation_pool_error.hpp"
#include "state_processing/operation_verifier.hpp"

namespace oppool::op_pool {
  using state_processing::VerifySignatures;

  namespace {
    /// Up to `limit` values of `map` passing `filter`, in key order
    template <typename Map, typename Filter>
    auto filterLimitOperations(const Map &map,
                               const Filter &filter,
                               size_t limit) {
      std::vector<typename Map::mapped_type> operations;
      for (auto &[_, operation] : map) {
        if (operations.size() >= limit) {
          break;
        }
        if (filter(operation)) {
          operations.emplace_back(operation);
        }
      }
      return operations;
    }

    /**
     * Remove entries keyed by validator index for which `prune_if` is true.
     * Entries of unknown validators are kept.
     */
    template <typename Map, typename PruneIf>
    size_t pruneValidatorMap(Map &map,
                             const PruneIf &prune_if,
                             const State &finalized_state) {
      return std::erase_if(map, [&](const auto &entry) {
        auto validator = finalized_state.validator(entry.first);
        return validator != nullptr and prune_if(*validator);
      });
    }
  }  // namespace

  OperationPool::OperationPool(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<state_processing::OperationVerifier> verifier,
      qtils::SharedRef<crypto::bls::BlsProvider> bls_provider)
      : logger_(logsys->getLogger("OperationPool", "op_pool")),
        verifier_(std::move(verifier)),
        bls_provider_(std::move(bls_provider)) {}

  outcome::result<void> OperationPool::insertAttestation(
      const Attestation &attestation,
      const State &state,
      const ChainSpec &spec) {
    auto id = AttestationId::fromData(attestation.data, state, spec);

    return attestations_.exclusiveAccess(
        [&](AttestationBuckets &buckets) -> outcome::result<void> {
          auto it = buckets.find(id);
          if (it == buckets.end()) {
            buckets.emplace(std::move(id), std::vector{attestation});
            return outcome::success();
          }

          auto &bucket = it->second;
          for (auto &existing : bucket) {
            if (existing.signersDisjointFrom(attestation)) {
              auto signature_res = bls_provider_->aggregate(
                  existing.signature, attestation.signature);
              if (signature_res.has_error()) {
                SL_WARN(logger_,
                        "Can't aggregate attestation for slot {}: {}",
                        attestation.data.slot,
                        signature_res.error());
                return OperationPoolError::AGGREGATION_FAILED;
              }
              existing.aggregation_bits.merge(attestation.aggregation_bits);
              existing.signature = signature_res.value();
              return outcome::success();
            }
            if (existing == attestation) {
              return outcome::success();
            }
          }

          bucket.emplace_back(attestation);
          SL_TRACE(logger_,
                   "Attestation for slot {} kept apart, {} in bucket",
                   attestation.data.slot,
                   bucket.size());
          return outcome::success();
        });
  }

  size_t OperationPool::numAttestations() const {
    return attestations_.sharedAccess([](const AttestationBuckets &buckets) {
      return std::accumulate(buckets.begin(),
                             buckets.end(),
                             size_t{0},
                             [](size_t sum, const auto &entry) {
                               return sum + entry.second.size();
                             });
    });
  }

  std::vector<Attestation> OperationPool::getAttestations(
      const State &state, const ChainSpec &spec) const {
    // Attestations of the current fork, from the current or previous epoch
    auto previous_domain =
        AttestationId::computeDomainBytes(state.previousEpoch(spec), state, spec);
    auto current_domain =
        AttestationId::computeDomainBytes(state.currentEpoch(spec), state, spec);

    return attestations_.sharedAccess([&](const AttestationBuckets &buckets) {
      std::vector<AttestationMaxCover> candidates;
      for (auto &[id, bucket] : buckets) {
        if (not id.domainBytesMatch(previous_domain)
            and not id.domainBytesMatch(current_domain)) {
          continue;
        }
        for (auto &attestation : bucket) {
          auto valid_res = verifier_->verifyAttestationForBlockInclusion(
              state, attestation, VerifySignatures::True, spec);
          if (valid_res.has_error()) {
            SL_TRACE(logger_,
                     "Attestation for slot {} not includable: {}",
                     attestation.data.slot,
                     valid_res.error());
            continue;
          }
          candidates.emplace_back(
              attestation,
              earliestAttestationValidators(attestation, state, spec));
        }
      }
      auto num_candidates = candidates.size();
      auto selected =
          maximumCover(std::move(candidates), spec.max_attestations);
      SL_DEBUG(logger_,
               "Selected {} of {} attestations for slot {}",
               selected.size(),
               num_candidates,
               state.slot);
      return selected;
    });
  }

  void OperationPool::pruneAttestations(const State &finalized_state,
                                        const ChainSpec &spec) {
    // Attestation is includable while state.slot <= slot + SLOTS_PER_EPOCH.
    // Approximate it by epoch, to not depend on the attestation slot.
    auto current_epoch = finalized_state.currentEpoch(spec);
    auto removed =
        attestations_.exclusiveAccess([&](AttestationBuckets &buckets) {
          return std::erase_if(buckets, [&](const auto &entry) {
            auto &bucket = entry.second;
            // Bucket entries share the data, so check the first one
            return bucket.empty()
                or bucket.front().data.target.epoch + 1 < current_epoch;
          });
        });
    SL_DEBUG(logger_, "Pruned {} attestation buckets", removed);
  }

  outcome::result<void> OperationPool::insertProposerSlashing(
      const ProposerSlashing &slashing,
      const State &state,
      const ChainSpec &spec) {
    OUTCOME_TRY(verifier_->verifyProposerSlashing(
        slashing, state, VerifySignatures::True, spec));
    proposer_slashings_.exclusiveAccess([&](ProposerSlashings &slashings) {
      slashings.insert_or_assign(slashing.proposerIndex(), slashing);
    });
    return outcome::success();
  }

  OperationPool::AttesterSlashingId OperationPool::attesterSlashingId(
      const AttesterSlashing &slashing,
      const State &state,
      const ChainSpec &spec) {
    return {
        AttestationId::fromData(slashing.attestation_1.data, state, spec),
        AttestationId::fromData(slashing.attestation_2.data, state, spec),
    };
  }

  outcome::result<void> OperationPool::insertAttesterSlashing(
      const AttesterSlashing &slashing,
      const State &state,
      const ChainSpec &spec) {
    OUTCOME_TRY(slashable_indices,
                verifier_->verifyAttesterSlashing(
                    state, slashing, VerifySignatures::True, spec));
    SL_TRACE(logger_,
             "Attester slashing of {} validators accepted",
             slashable_indices.size());
    auto id = attesterSlashingId(slashing, state, spec);
    attester_slashings_.exclusiveAccess([&](AttesterSlashings &slashings) {
      slashings.insert_or_assign(std::move(id), slashing);
    });
    return outcome::success();
  }

  std::pair<std::vector<ProposerSlashing>, std::vector<AttesterSlashing>>
  OperationPool::getSlashings(const State &state, const ChainSpec &spec) const {
    auto proposer_slashings =
        proposer_slashings_.sharedAccess([&](const ProposerSlashings &map) {
          return filterLimitOperations(
              map,
              [&](const ProposerSlashing &slashing) {
                auto proposer = state.validator(slashing.proposerIndex());
                return proposer != nullptr and not proposer->slashed;
              },
              spec.max_proposer_slashings);
        });

    // Validators slashed by this block so far
    ToBeSlashed to_be_slashed;
    for (auto &slashing : proposer_slashings) {
      to_be_slashed.emplace(slashing.proposerIndex());
    }

    auto attester_slashings =
        selectAttesterSlashings(state, spec, to_be_slashed);

    return {std::move(proposer_slashings), std::move(attester_slashings)};
  }

  std::vector<AttesterSlashing> OperationPool::selectAttesterSlashings(
      const State &state,
      const ChainSpec &spec,
      ToBeSlashed &to_be_slashed) const {
    return attester_slashings_.sharedAccess([&](const AttesterSlashings &map) {
      std::vector<AttesterSlashing> selected;
      for (auto &[id, slashing] : map) {
        if (selected.size() >= spec.max_attester_slashings) {
          break;
        }
        // Check the fork
        if (attesterSlashingId(slashing, state, spec) != id) {
          continue;
        }
        auto indices_res = verifier_->getSlashableIndices(
            state,
            slashing,
            [&](ValidatorIndex index, const Validator &validator) {
              return validator.slashed or to_be_slashed.contains(index);
            },
            spec);
        if (indices_res.has_error()) {
          continue;
        }
        to_be_slashed.insert(indices_res.value().begin(),
                             indices_res.value().end());
        selected.emplace_back(slashing);
      }
      return selected;
    });
  }

  void OperationPool::pruneProposerSlashings(const State &finalized_state,
                                             const ChainSpec &spec) {
    auto epoch = finalized_state.currentEpoch(spec);
    auto removed =
        proposer_slashings_.exclusiveAccess([&](ProposerSlashings &map) {
          return pruneValidatorMap(
              map,
              [&](const Validator &validator) {
                return validator.slashed or validator.isWithdrawableAt(epoch);
              },
              finalized_state);
        });
    SL_DEBUG(logger_, "Pruned {} proposer slashings", removed);
  }

  void OperationPool::pruneAttesterSlashings(const State &finalized_state,
                                             const ChainSpec &spec) {
    auto epoch = finalized_state.currentEpoch(spec);
    auto removed =
        attester_slashings_.exclusiveAccess([&](AttesterSlashings &map) {
          return std::erase_if(map, [&](const auto &entry) {
            auto &[id, slashing] = entry;
            if (attesterSlashingId(slashing, finalized_state, spec) != id) {
              return true;
            }
            auto indices_res = verifier_->getSlashableIndices(
                finalized_state,
                slashing,
                [&](ValidatorIndex, const Validator &validator) {
                  return validator.slashed or validator.isWithdrawableAt(epoch);
                },
                spec);
            return indices_res.has_error();
          });
        });
    SL_DEBUG(logger_, "Pruned {} attester slashings", removed);
  }

  size_t OperationPool::numProposerSlashings() const {
    return proposer_slashings_.sharedAccess(
        [](const ProposerSlashings &map) { return map.size(); });
  }

  size_t OperationPool::numAttesterSlashings() const {
    return attester_slashings_.sharedAccess(
        [](const AttesterSlashings &map) { return map.size(); });
  }

  outcome::result<void> OperationPool::insertVoluntaryExit(
      const SignedVoluntaryExit &exit,
      const State &state,
      const ChainSpec &spec) {
    OUTCOME_TRY(verifier_->verifyExitTimeIndependentOnly(
        state, exit, VerifySignatures::True, spec));
    voluntary_exits_.exclusiveAccess([&](VoluntaryExits &exits) {
      exits.insert_or_assign(exit.message.validator_index, exit);
    });
    return outcome::success();
  }

  std::vector<SignedVoluntaryExit> OperationPool::getVoluntaryExits(
      const State &state, const ChainSpec &spec) const {
    return voluntary_exits_.sharedAccess([&](const VoluntaryExits &exits) {
      return filterLimitOperations(
          exits,
          [&](const SignedVoluntaryExit &exit) {
            return verifier_
                ->verifyExit(state, exit, VerifySignatures::False, spec)
                .has_value();
          },
          spec.max_voluntary_exits);
    });
  }

  void OperationPool::pruneVoluntaryExits(const State &finalized_state,
                                          const ChainSpec &spec) {
    auto epoch = finalized_state.currentEpoch(spec);
    auto removed = voluntary_exits_.exclusiveAccess([&](VoluntaryExits &map) {
      return pruneValidatorMap(
          map,
          [&](const Validator &validator) {
            return validator.isExitedAt(epoch);
          },
          finalized_state);
    });
    SL_DEBUG(logger_, "Pruned {} voluntary exits", removed);
  }

  size_t OperationPool::numVoluntaryExits() const {
    return voluntary_exits_.sharedAccess(
        [](const VoluntaryExits &map) { return map.size(); });
  }

  void OperationPool::pruneAll(const State &finalized_state,
                               const ChainSpec &spec) {
    pruneAttestations(finalized_state, spec);
    pruneProposerSlashings(finalized_state, spec);
    pruneAttesterSlashings(finalized_state, spec);
    pruneVoluntaryExits(finalized_state, spec);
  }

  namespace {
    /// Compares stores of two pools, holding one lock at a time
    template <typename T>
    bool equalStores(const utils::SafeObject<T> &lhs,
                     const utils::SafeObject<T> &rhs) {
      auto copy = lhs.sharedAccess([](const T &store) { return store; });
      return rhs.sharedAccess([&](const T &store) { return store == copy; });
    }
  }  // namespace

  bool OperationPool::operator==(const OperationPool &other) const {
    if (this == &other) {
      return true;
    }
    return equalStores(attestations_, other.attestations_)
       and equalStores(attester_slashings_, other.attester_slashings_)
       and equalStores(proposer_slashings_, other.proposer_slashings_)
       and equalStores(voluntary_exits_, other.voluntary_exits_);
  }

}  // namespace oppool::op_pool
