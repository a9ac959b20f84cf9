/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/approval/block_info.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "core/parachain/approval/approval_test_utils.hpp"
#include "mock/core/crypto/hasher_mock.hpp"
#include "mock/core/crypto/key_store_mock.hpp"
#include "mock/core/crypto/vrf_provider_mock.hpp"
#include "mock/core/parachain/assignment_criteria_mock.hpp"
#include "mock/core/runtime/parachain_host_mock.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/outcome/dummy_error.hpp"
#include "testutil/prepare_loggers.hpp"

using vigil::consensus::babe::SlotType;
using vigil::crypto::HasherMock;
using vigil::crypto::KeyStoreMock;
using vigil::crypto::VRFProviderMock;
using vigil::crypto::VRFStory;
using vigil::parachain::CandidateHash;
using vigil::parachain::SessionIndex;
using vigil::parachain::approval::AssignmentCriteriaMock;
using vigil::parachain::approval::AssignmentsList;
using vigil::parachain::approval::CriteriaConfig;
using vigil::parachain::approval::ImportedBlockInfoEnv;
using vigil::parachain::approval::importedBlockInfo;
using vigil::parachain::approval::LeavingCores;
using vigil::parachain::approval::RelayVRFStory;
using vigil::parachain::approval::RollingSessionWindow;
using vigil::primitives::BlockHash;
using vigil::primitives::BlockHeader;
using vigil::runtime::CandidateEvent;
using vigil::runtime::ParachainHostMock;
using vigil::runtime::SessionInfo;
using testing::_;
using testing::NiceMock;
using testing::Return;

class BlockInfoTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    ON_CALL(hasher_, blake2b_256(_)).WillByDefault(testutil::tailHash);
    ON_CALL(parachain_host_, session_info(_, _))
        .WillByDefault(Return(std::optional<SessionInfo>(session_)));
    ON_CALL(parachain_host_, session_index_for_child(block_header_.parent_hash))
        .WillByDefault(Return(SessionIndex{3}));
    ON_CALL(parachain_host_, candidate_events(block_hash_))
        .WillByDefault(Return(std::vector<CandidateEvent>{
            testutil::includedEvent(c1_, 0, 1),
            testutil::backedEvent("backed"_hash256),
            testutil::includedEvent(c2_, 1, 0),
        }));
    ON_CALL(parachain_host_, current_babe_epoch(block_hash_))
        .WillByDefault(Return(testutil::babeEpoch(3)));
    ON_CALL(vrf_provider_, computeRelayVrfStory(_, _, _, _, _))
        .WillByDefault(Return(story_));

    primeWindow(3);
  }

  /// Fills the window up to the given session
  void primeWindow(SessionIndex session) {
    const BlockHeader prime_header{.number = 2,
                                   .parent_hash = "prime parent"_hash256};
    EXPECT_CALL(parachain_host_,
                session_index_for_child(prime_header.parent_hash))
        .WillOnce(Return(session));
    EXPECT_OUTCOME_TRUE_1(window_.cache_session_info_for_head(
        parachain_host_, "prime"_hash256, prime_header));
  }

  auto blockInfo() {
    return importedBlockInfo(env_, block_hash_, block_header_, logger_);
  }

  const SessionInfo session_ = testutil::sessionInfo(6);
  const CandidateHash c1_ = "candidate 1"_hash256;
  const CandidateHash c2_ = "candidate 2"_hash256;
  const VRFStory story_ = "story"_hash256;
  const BlockHash block_hash_ = "block"_hash256;
  BlockHeader block_header_{
      .number = 10,
      .parent_hash = "parent"_hash256,
      .digest = testutil::babeDigest(42),
  };

  NiceMock<ParachainHostMock> parachain_host_;
  NiceMock<AssignmentCriteriaMock> criteria_;
  NiceMock<VRFProviderMock> vrf_provider_;
  NiceMock<HasherMock> hasher_;
  std::shared_ptr<KeyStoreMock> keystore_ =
      std::make_shared<NiceMock<KeyStoreMock>>();
  RollingSessionWindow window_;

  ImportedBlockInfoEnv env_{
      .parachain_host = parachain_host_,
      .session_window = window_,
      .assignment_criteria = criteria_,
      .keystore = keystore_,
      .vrf_provider = vrf_provider_,
      .hasher = hasher_,
  };
  vigil::log::Logger logger_ = vigil::log::createLogger("test", "testing");
};

/**
 * @given block including two candidates, authored in a primary slot
 * @when its approval info is collected
 * @then included candidates, session, story, assignments and slot are returned
 */
TEST_F(BlockInfoTest, GoodBlock) {
  const auto epoch = testutil::babeEpoch(3);
  EXPECT_CALL(vrf_provider_,
              computeRelayVrfStory(epoch.authorities[0].id,
                                   _,
                                   epoch.randomness,
                                   42,
                                   epoch.epoch_index))
      .WillOnce(Return(story_));

  AssignmentsList assignments;
  assignments.emplace(0, testutil::ourAssignment(0));
  EXPECT_CALL(criteria_,
              compute_assignments(std::shared_ptr<vigil::crypto::KeyStore>(
                                      keystore_),
                                  RelayVRFStory{story_},
                                  CriteriaConfig::from(session_),
                                  LeavingCores{{0, 1}, {1, 0}}))
      .WillOnce(Return(assignments));

  auto info = blockInfo();
  ASSERT_TRUE(info);
  ASSERT_EQ(info->included_candidates.size(), 2);
  const auto &[hash_1, receipt_1, core_1, group_1] =
      info->included_candidates[0];
  EXPECT_EQ(hash_1, c1_);
  EXPECT_EQ(receipt_1, testutil::receiptOf(c1_));
  EXPECT_EQ(core_1, 0);
  EXPECT_EQ(group_1, 1);
  EXPECT_EQ(std::get<0>(info->included_candidates[1]), c2_);
  EXPECT_EQ(info->session_index, 3);
  EXPECT_EQ(info->assignments, assignments);
  EXPECT_EQ(info->n_validators, 6);
  EXPECT_EQ(info->relay_vrf_story.data, story_);
  EXPECT_EQ(info->slot, 42);
}

/**
 * @given block without the BABE pre-runtime digest
 * @when its approval info is collected
 * @then nothing is returned and no assignment is computed
 */
TEST_F(BlockInfoTest, MissingVrfDigest) {
  block_header_.digest.clear();
  EXPECT_CALL(criteria_, compute_assignments(_, _, _, _)).Times(0);

  EXPECT_FALSE(blockInfo());
}

/**
 * @given window of sessions 5..10
 * @when approval info of a block of session 4 is collected
 * @then the block is skipped as ancient
 */
TEST_F(BlockInfoTest, AncientSession) {
  primeWindow(10);
  ASSERT_EQ(window_.earliest_session(), 5);
  ON_CALL(parachain_host_, session_index_for_child(block_header_.parent_hash))
      .WillByDefault(Return(SessionIndex{4}));
  EXPECT_CALL(parachain_host_, current_babe_epoch(_)).Times(0);

  EXPECT_FALSE(blockInfo());
}

/**
 * @given block of a session the window doesn't hold yet
 * @when its approval info is collected
 * @then nothing is returned
 */
TEST_F(BlockInfoTest, SessionOutsideWindow) {
  ON_CALL(parachain_host_, session_index_for_child(block_header_.parent_hash))
      .WillByDefault(Return(SessionIndex{4}));
  EXPECT_CALL(criteria_, compute_assignments(_, _, _, _)).Times(0);

  EXPECT_FALSE(blockInfo());
}

/**
 * @given block authored in a secondary plain slot
 * @when its approval info is collected
 * @then nothing is returned since the block carries no VRF output
 */
TEST_F(BlockInfoTest, SecondaryPlainSlot) {
  block_header_.digest = testutil::babeDigest(42, 0, SlotType::SecondaryPlain);
  EXPECT_CALL(vrf_provider_, computeRelayVrfStory(_, _, _, _, _)).Times(0);

  EXPECT_FALSE(blockInfo());
}

/**
 * @given block authored in a secondary VRF slot
 * @when its approval info is collected
 * @then the info is returned
 */
TEST_F(BlockInfoTest, SecondaryVrfSlot) {
  block_header_.digest = testutil::babeDigest(43, 1, SlotType::SecondaryVRF);

  auto info = blockInfo();
  ASSERT_TRUE(info);
  EXPECT_EQ(info->slot, 43);
}

/**
 * @given block whose author index exceeds the epoch authorities
 * @when its approval info is collected
 * @then nothing is returned
 */
TEST_F(BlockInfoTest, AuthorityOutOfBounds) {
  block_header_.digest = testutil::babeDigest(42, 3);
  EXPECT_CALL(vrf_provider_, computeRelayVrfStory(_, _, _, _, _)).Times(0);

  EXPECT_FALSE(blockInfo());
}

/**
 * @given VRF output not matching the BABE transcript
 * @when approval info of the block is collected
 * @then nothing is returned
 */
TEST_F(BlockInfoTest, VrfFailure) {
  EXPECT_CALL(vrf_provider_, computeRelayVrfStory(_, _, _, _, _))
      .WillOnce(Return(outcome::failure(testutil::DummyError::ERROR)));
  EXPECT_CALL(criteria_, compute_assignments(_, _, _, _)).Times(0);

  EXPECT_FALSE(blockInfo());
}

/**
 * @given runtime failing the candidate events query
 * @when approval info of the block is collected
 * @then nothing is returned
 */
TEST_F(BlockInfoTest, CandidateEventsFailure) {
  EXPECT_CALL(parachain_host_, candidate_events(block_hash_))
      .WillOnce(Return(outcome::failure(testutil::DummyError::ERROR)));

  EXPECT_FALSE(blockInfo());
}

/**
 * @given runtime failing the BABE epoch query
 * @when approval info of the block is collected
 * @then nothing is returned
 */
TEST_F(BlockInfoTest, EpochFailure) {
  EXPECT_CALL(parachain_host_, current_babe_epoch(block_hash_))
      .WillOnce(Return(outcome::failure(testutil::DummyError::ERROR)));

  EXPECT_FALSE(blockInfo());
}
