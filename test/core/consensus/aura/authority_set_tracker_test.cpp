/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/aura/authority_set_tracker.hpp"

#include <gtest/gtest.h>

#include "api/transport/error.hpp"
#include "crypto/sha/sha256.hpp"
#include "mock/api/chain_rpc_mock.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/primitives/mp_utils.hpp"

using namespace slotwatch;
using consensus::aura::AuthoritySetFingerprint;
using consensus::aura::AuthoritySetTracker;
using testing::Return;
using testutil::createAuthority;

class AuthoritySetTrackerTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    rpc = std::make_shared<api::ChainRpcMock>();
    tracker = std::make_shared<AuthoritySetTracker>(rpc);
  }

 protected:
  std::shared_ptr<api::ChainRpcMock> rpc;
  std::shared_ptr<AuthoritySetTracker> tracker;
};

/**
 * @given node returning two authorities
 * @when tracker fetches the set
 * @then the same list in the same order is returned
 */
TEST_F(AuthoritySetTrackerTest, Fetch) {
  primitives::AuthorityList list{createAuthority(2), createAuthority(1)};
  EXPECT_CALL(*rpc, authorities()).WillOnce(Return(list));
  EXPECT_OUTCOME_TRUE(fetched, tracker->fetch());
  EXPECT_EQ(fetched, list);
}

/**
 * @given node failing to answer
 * @when tracker fetches the set
 * @then the error is propagated
 */
TEST_F(AuthoritySetTrackerTest, FetchFails) {
  EXPECT_CALL(*rpc, authorities())
      .WillOnce(Return(api::TransportError::RECEIVE_FAILED));
  EXPECT_EC(tracker->fetch(), api::TransportError::RECEIVE_FAILED);
}

/**
 * @given a set of two keys
 * @when fingerprint is computed
 * @then it is sha256 of the concatenated keys and depends on their order
 */
TEST_F(AuthoritySetTrackerTest, Fingerprint) {
  auto a = createAuthority(1);
  auto b = createAuthority(2);
  common::Buffer concatenated;
  concatenated.put(a.view()).put(b.view());

  EXPECT_EQ(AuthoritySetTracker::fingerprint({a, b}),
            crypto::sha256(concatenated.view()));
  EXPECT_NE(AuthoritySetTracker::fingerprint({a, b}),
            AuthoritySetTracker::fingerprint({b, a}));
}

/**
 * @given fingerprints of sets
 * @when they are compared with previous observation
 * @then change is reported for a first observation, another digest or
 * another length only
 */
TEST_F(AuthoritySetTrackerTest, Changed) {
  auto a = createAuthority(1);
  auto b = createAuthority(2);
  const AuthoritySetFingerprint ab{AuthoritySetTracker::fingerprint({a, b}), 2};
  const AuthoritySetFingerprint ba{AuthoritySetTracker::fingerprint({b, a}), 2};

  EXPECT_TRUE(AuthoritySetTracker::changed(std::nullopt, ab));
  EXPECT_FALSE(AuthoritySetTracker::changed(ab, ab));
  EXPECT_TRUE(AuthoritySetTracker::changed(ab, ba));
  EXPECT_TRUE(AuthoritySetTracker::changed(
      ab, AuthoritySetFingerprint{ab.digest, 3}));
}

/**
 * @given a set
 * @when membership is checked
 * @then only keys of the set are found
 */
TEST_F(AuthoritySetTrackerTest, Contains) {
  primitives::AuthorityList list{createAuthority(1), createAuthority(2)};
  EXPECT_TRUE(AuthoritySetTracker::contains(list, createAuthority(2)));
  EXPECT_FALSE(AuthoritySetTracker::contains(list, createAuthority(3)));
  EXPECT_FALSE(AuthoritySetTracker::contains({}, createAuthority(1)));
}
