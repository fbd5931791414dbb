/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>

#include "crypto/bls/bls_provider_fake.hpp"
#include "mock/state_processing/operation_verifier_mock.hpp"
#include "op_pool/operation_pool.hpp"
#include "state_processing/errors.hpp"
#include "state_processing/operation_verifier_impl.hpp"
#include "testutil/operations.hpp"
#include "testutil/outcome_error.hpp"
#include "testutil/prepare_loggers.hpp"

using oppool::AttesterSlashing;
using oppool::ChainSpec;
using oppool::ProposerSlashing;
using oppool::State;
using oppool::ValidatorIndex;
using oppool::crypto::bls::BlsProviderFake;
using oppool::op_pool::OperationPool;
using oppool::state_processing::AttesterSlashingValidationError;
using oppool::state_processing::OperationVerifierImpl;
using oppool::state_processing::OperationVerifierMock;
using oppool::state_processing::ProposerSlashingValidationError;
using testutil::attesterSlashing;
using testutil::makeState;
using testutil::proposerSlashing;

class SlashingPoolTest : public ::testing::Test {
 protected:
  static void SetUpTestSuite() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    pool = std::make_shared<OperationPool>(
        testutil::prepareLoggers(),
        std::make_shared<OperationVerifierImpl>(bls_provider),
        bls_provider);
  }

  void slash(ValidatorIndex index) {
    auto &validator = state.validators.data()[index];
    validator.slashed = true;
    validator.withdrawable_epoch = state.currentEpoch(spec) + 8192;
  }

  ChainSpec spec = ChainSpec::minimal();
  State state = makeState(16, 10 * spec.slots_per_epoch, spec);
  std::shared_ptr<BlsProviderFake> bls_provider =
      std::make_shared<BlsProviderFake>();
  std::shared_ptr<OperationPool> pool;
};

/**
 * @given a proposer slashing of validator 3 and attester slashings of
 * {3}, {3, 4} and {4}, in that order
 * @when selecting slashings for a block
 * @then the proposer slashing and only the attester slashing of {3, 4} are
 * selected
 */
TEST_F(SlashingPoolTest, RedundantSlashingsSkipped) {
  auto proposer_slashing = proposerSlashing(state, 3, spec);
  auto slashing_3 = attesterSlashing(state, 1, {3}, spec);
  auto slashing_3_4 = attesterSlashing(state, 2, {3, 4}, spec);
  auto slashing_4 = attesterSlashing(state, 3, {4}, spec);

  EXPECT_OUTCOME_SUCCESS(
      pool->insertProposerSlashing(proposer_slashing, state, spec));
  EXPECT_OUTCOME_SUCCESS(pool->insertAttesterSlashing(slashing_3, state, spec));
  EXPECT_OUTCOME_SUCCESS(
      pool->insertAttesterSlashing(slashing_3_4, state, spec));
  EXPECT_OUTCOME_SUCCESS(pool->insertAttesterSlashing(slashing_4, state, spec));
  EXPECT_EQ(pool->numAttesterSlashings(), 3);

  auto [proposer_slashings, attester_slashings] =
      pool->getSlashings(state, spec);
  EXPECT_EQ(proposer_slashings, std::vector{proposer_slashing});
  EXPECT_EQ(attester_slashings, std::vector{slashing_3_4});
}

/**
 * @given a set of validators already to be slashed
 * @when selecting attester slashings
 * @then the set is extended by validators of selected slashings
 */
TEST_F(SlashingPoolTest, SelectExtendsToBeSlashed) {
  auto slashing = attesterSlashing(state, 1, {2, 5, 6}, spec);
  EXPECT_OUTCOME_SUCCESS(pool->insertAttesterSlashing(slashing, state, spec));

  OperationPool::ToBeSlashed to_be_slashed{5};
  auto selected = pool->selectAttesterSlashings(state, spec, to_be_slashed);
  EXPECT_EQ(selected, std::vector{slashing});
  EXPECT_EQ(to_be_slashed, (OperationPool::ToBeSlashed{2, 5, 6}));

  to_be_slashed = {2, 5, 6};
  EXPECT_TRUE(pool->selectAttesterSlashings(state, spec, to_be_slashed).empty());
}

/**
 * @given more slashings than a block can hold
 * @when selecting slashings
 * @then the per-block maxima are respected, lowest proposer first
 */
TEST_F(SlashingPoolTest, MaximaRespected) {
  spec.max_proposer_slashings = 2;
  spec.max_attester_slashings = 2;
  for (ValidatorIndex index : {9, 7, 8}) {
    EXPECT_OUTCOME_SUCCESS(pool->insertProposerSlashing(
        proposerSlashing(state, index, spec), state, spec));
  }
  for (ValidatorIndex index : {1, 2, 3}) {
    EXPECT_OUTCOME_SUCCESS(pool->insertAttesterSlashing(
        attesterSlashing(state, index, {index}, spec), state, spec));
  }

  auto [proposer_slashings, attester_slashings] =
      pool->getSlashings(state, spec);
  ASSERT_EQ(proposer_slashings.size(), 2);
  EXPECT_EQ(proposer_slashings[0].proposerIndex(), 7);
  EXPECT_EQ(proposer_slashings[1].proposerIndex(), 8);
  EXPECT_EQ(attester_slashings.size(), 2);
}

/**
 * @given two proposer slashings of the same validator
 * @when inserting both
 * @then the later one replaces the earlier
 */
TEST_F(SlashingPoolTest, ProposerSlashingReplaced) {
  auto first = proposerSlashing(state, 4, spec);
  auto second = first;
  second.signed_header_2 =
      testutil::signedHeader(state, state.slot - 1, 4, 0x53, spec);

  EXPECT_OUTCOME_SUCCESS(pool->insertProposerSlashing(first, state, spec));
  EXPECT_OUTCOME_SUCCESS(pool->insertProposerSlashing(second, state, spec));
  EXPECT_EQ(pool->numProposerSlashings(), 1);
  EXPECT_EQ(pool->getSlashings(state, spec).first, std::vector{second});
}

/**
 * @given invalid slashings
 * @when inserting them
 * @then the validation error is returned and nothing is stored
 */
TEST_F(SlashingPoolTest, InvalidSlashingsRejected) {
  auto identical = proposerSlashing(state, 4, spec);
  identical.signed_header_2 = identical.signed_header_1;
  EXPECT_TRUE(testutil::hasError(
      pool->insertProposerSlashing(identical, state, spec),
      ProposerSlashingValidationError::PROPOSALS_IDENTICAL));

  auto forged = attesterSlashing(state, 1, {2, 3}, spec);
  forged.attestation_2.signature[0] ^= 1;
  EXPECT_TRUE(
      testutil::hasError(pool->insertAttesterSlashing(forged, state, spec),
                         AttesterSlashingValidationError::BAD_SIGNATURE));

  slash(6);
  EXPECT_TRUE(testutil::hasError(
      pool->insertAttesterSlashing(
          attesterSlashing(state, 1, {6}, spec), state, spec),
      AttesterSlashingValidationError::NO_SLASHABLE_INDICES));

  EXPECT_EQ(pool->numProposerSlashings(), 0);
  EXPECT_EQ(pool->numAttesterSlashings(), 0);
}

/**
 * @given a verifier rejecting every slashing
 * @when inserting slashings
 * @then its errors are returned unchanged
 */
TEST(SlashingPoolVerifierTest, VerifierErrorsPropagated) {
  auto spec = ChainSpec::minimal();
  auto state = makeState(8, 3 * spec.slots_per_epoch, spec);
  auto verifier = std::make_shared<OperationVerifierMock>();
  OperationPool pool(testutil::prepareLoggers(),
                     verifier,
                     std::make_shared<BlsProviderFake>());

  EXPECT_CALL(*verifier, verifyProposerSlashing)
      .WillOnce(testing::Return(outcome::result<void>(
          ProposerSlashingValidationError::PROPOSER_NOT_SLASHABLE)));
  EXPECT_CALL(*verifier, verifyAttesterSlashing)
      .WillOnce(testing::Return(outcome::result<std::vector<ValidatorIndex>>(
          AttesterSlashingValidationError::NOT_SLASHABLE)));

  EXPECT_TRUE(testutil::hasError(
      pool.insertProposerSlashing(proposerSlashing(state, 1, spec), state, spec),
      ProposerSlashingValidationError::PROPOSER_NOT_SLASHABLE));
  EXPECT_TRUE(testutil::hasError(
      pool.insertAttesterSlashing(
          attesterSlashing(state, 1, {1}, spec), state, spec),
      AttesterSlashingValidationError::NOT_SLASHABLE));
  EXPECT_EQ(pool.numProposerSlashings(), 0);
  EXPECT_EQ(pool.numAttesterSlashings(), 0);
}

/**
 * @given proposer slashings of validators 2 and 3
 * @when 2 is slashed in the state
 * @then its slashing is neither selected nor kept by pruning
 */
TEST_F(SlashingPoolTest, ProposerSlashingOfSlashedValidator) {
  EXPECT_OUTCOME_SUCCESS(pool->insertProposerSlashing(
      proposerSlashing(state, 2, spec), state, spec));
  EXPECT_OUTCOME_SUCCESS(pool->insertProposerSlashing(
      proposerSlashing(state, 3, spec), state, spec));

  slash(2);
  auto proposer_slashings = pool->getSlashings(state, spec).first;
  ASSERT_EQ(proposer_slashings.size(), 1);
  EXPECT_EQ(proposer_slashings[0].proposerIndex(), 3);

  pool->pruneProposerSlashings(state, spec);
  EXPECT_EQ(pool->numProposerSlashings(), 1);
}

/**
 * @given attester slashings of {2, 3} and {4}
 * @when 2 and 4 are slashed in the finalized state
 * @then only the slashing still slashing somebody is kept
 */
TEST_F(SlashingPoolTest, PruneAttesterSlashings) {
  auto slashing_2_3 = attesterSlashing(state, 1, {2, 3}, spec);
  auto slashing_4 = attesterSlashing(state, 2, {4}, spec);
  EXPECT_OUTCOME_SUCCESS(
      pool->insertAttesterSlashing(slashing_2_3, state, spec));
  EXPECT_OUTCOME_SUCCESS(pool->insertAttesterSlashing(slashing_4, state, spec));

  slash(2);
  slash(4);
  pool->pruneAttesterSlashings(state, spec);
  EXPECT_EQ(pool->numAttesterSlashings(), 1);
  EXPECT_EQ(pool->getSlashings(state, spec).second, std::vector{slashing_2_3});
}

/**
 * @given an attester slashing
 * @when the finalized state is on another fork
 * @then the slashing is neither selected nor kept by pruning
 */
TEST_F(SlashingPoolTest, AttesterSlashingOfOtherFork) {
  EXPECT_OUTCOME_SUCCESS(pool->insertAttesterSlashing(
      attesterSlashing(state, 1, {2}, spec), state, spec));

  auto other_state = state;
  other_state.fork.previous_version = state.fork.current_version;
  other_state.fork.current_version = testutil::makeVersion(2);
  other_state.fork.epoch = 0;
  EXPECT_TRUE(pool->getSlashings(other_state, spec).second.empty());

  pool->pruneAttesterSlashings(other_state, spec);
  EXPECT_EQ(pool->numAttesterSlashings(), 0);
}
