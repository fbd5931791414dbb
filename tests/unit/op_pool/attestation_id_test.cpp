/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "op_pool/attestation_id.hpp"

#include <gtest/gtest.h>

#include "serde/serialization.hpp"
#include "testutil/operations.hpp"

using oppool::ChainSpec;
using oppool::Version;
using oppool::op_pool::AttestationId;

class AttestationIdTest : public ::testing::Test {
 protected:
  ChainSpec spec = ChainSpec::minimal();
  oppool::State state = testutil::makeState(16, 10 * spec.slots_per_epoch, spec);
  oppool::AttestationData data =
      testutil::makeAttestationData(state, state.slot - 1, 0, spec);
};

/**
 * @given the same vote and state
 * @when computing the key twice
 * @then keys are equal and end with the attester domain of the target epoch
 */
TEST_F(AttestationIdTest, Deterministic) {
  auto id_1 = AttestationId::fromData(data, state, spec);
  auto id_2 = AttestationId::fromData(data, state, spec);
  EXPECT_EQ(id_1, id_2);
  EXPECT_FALSE(id_1 < id_2);
  EXPECT_EQ(id_1.bytes.size(), oppool::encode(data).size() + 32);
  EXPECT_TRUE(id_1.domainBytesMatch(
      AttestationId::computeDomainBytes(data.target.epoch, state, spec)));
}

/**
 * @given the same vote and states of different forks
 * @when computing keys
 * @then keys differ, and only the matching domain is recognized
 */
TEST_F(AttestationIdTest, DifferentForkDifferentKey) {
  auto other_state = state;
  other_state.fork.current_version = testutil::makeVersion(2);

  auto id = AttestationId::fromData(data, state, spec);
  auto other_id = AttestationId::fromData(data, other_state, spec);
  EXPECT_NE(id, other_id);
  EXPECT_TRUE(id < other_id or other_id < id);

  auto other_domain = AttestationId::computeDomainBytes(
      data.target.epoch, other_state, spec);
  EXPECT_FALSE(id.domainBytesMatch(other_domain));
  EXPECT_TRUE(other_id.domainBytesMatch(other_domain));
}

/**
 * @given a fork scheduled after the vote target epoch
 * @when computing the domain
 * @then the previous fork version is used before the fork epoch
 */
TEST_F(AttestationIdTest, ForkEpochSelectsVersion) {
  auto forked = state;
  forked.fork.previous_version = state.fork.current_version;
  forked.fork.current_version = testutil::makeVersion(2);
  forked.fork.epoch = data.target.epoch + 1;

  EXPECT_EQ(AttestationId::computeDomainBytes(data.target.epoch, forked, spec),
            AttestationId::computeDomainBytes(data.target.epoch, state, spec));
  EXPECT_NE(
      AttestationId::computeDomainBytes(data.target.epoch + 1, forked, spec),
      AttestationId::computeDomainBytes(data.target.epoch + 1, state, spec));
}

/**
 * @given a different genesis validators root
 * @when computing keys
 * @then keys differ
 */
TEST_F(AttestationIdTest, GenesisRootChangesKey) {
  auto other_state = state;
  other_state.genesis_validators_root = testutil::makeRoot(0x99);
  EXPECT_NE(AttestationId::fromData(data, state, spec),
            AttestationId::fromData(data, other_state, spec));
}

/**
 * @given a key shorter than a domain
 * @when matching a domain
 * @then nothing matches
 */
TEST_F(AttestationIdTest, ShortKeyMatchesNothing) {
  AttestationId id;
  id.bytes.resize(3);
  EXPECT_FALSE(id.domainBytesMatch(
      AttestationId::computeDomainBytes(0, state, spec)));
}
