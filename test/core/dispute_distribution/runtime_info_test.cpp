/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dispute_distribution/impl/runtime_info_impl.hpp"

#include <gtest/gtest.h>

#include "dispute_distribution/impl/errors.hpp"
#include "mock/core/crypto/session_keys_mock.hpp"
#include "mock/core/runtime/parachain_host_mock.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/outcome/dummy_error.hpp"
#include "testutil/prepare_loggers.hpp"

using tribune::crypto::SessionKeysImpl;
using tribune::crypto::SessionKeysMock;
using tribune::dispute::DisputeDistributionConfig;
using tribune::dispute::RuntimeInfoImpl;
using tribune::dispute::SessionObtainingError;
using tribune::parachain::ValidatorId;
using tribune::runtime::ParachainHostMock;
using tribune::runtime::SessionInfo;
using testing::_;
using testing::Return;

class RuntimeInfoTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    config_.session_index_cache_size = 2;
    config_.session_info_cache_size = 2;
    runtime_info_ =
        std::make_unique<RuntimeInfoImpl>(api_, session_keys_, config_);

    session_info_.validators = {validator(1), validator(2), validator(3)};
    session_info_.discovery_keys = {
        "a"_authority, "b"_authority, "c"_authority, "d"_authority};
    session_info_.validator_groups = {{0}, {2, 1}};
  }

  static ValidatorId validator(uint8_t seed) {
    ValidatorId id;
    id[0] = seed;
    return id;
  }

  const tribune::primitives::BlockHash parent = "parent"_hash256;

  DisputeDistributionConfig config_;
  std::shared_ptr<ParachainHostMock> api_ =
      std::make_shared<ParachainHostMock>();
  std::shared_ptr<SessionKeysMock> session_keys_ =
      std::make_shared<SessionKeysMock>();
  std::unique_ptr<RuntimeInfoImpl> runtime_info_;
  SessionInfo session_info_;
};

/**
 * @given runtime knowing the session index
 * @when asked twice for the same block
 * @then runtime is asked once
 */
TEST_F(RuntimeInfoTest, SessionIndexIsCached) {
  EXPECT_CALL(*api_, session_index_for_child(parent)).WillOnce(Return(7));

  ASSERT_OUTCOME_SUCCESS(first, runtime_info_->get_session_index_for_child(parent));
  ASSERT_OUTCOME_SUCCESS(second, runtime_info_->get_session_index_for_child(parent));
  EXPECT_EQ(first, 7);
  EXPECT_EQ(second, 7);
}

/**
 * @given runtime failing
 * @when asked for the session index
 * @then the error is returned and not cached
 */
TEST_F(RuntimeInfoTest, SessionIndexErrorIsNotCached) {
  EXPECT_CALL(*api_, session_index_for_child(parent))
      .WillOnce(Return(testutil::DummyError::ERROR))
      .WillOnce(Return(3));

  EXPECT_EC(runtime_info_->get_session_index_for_child(parent),
            testutil::DummyError::ERROR);
  ASSERT_OUTCOME_SUCCESS(index, runtime_info_->get_session_index_for_child(parent));
  EXPECT_EQ(index, 3);
}

/**
 * @given we are validator #1 which is in the second group
 * @when session info is requested twice
 * @then it is fetched once and carries our index and group
 */
TEST_F(RuntimeInfoTest, SessionInfoWithOurValidatorInfoIsCached) {
  EXPECT_CALL(*api_, session_info(parent, 4))
      .WillOnce(Return(std::optional<SessionInfo>{session_info_}));
  EXPECT_CALL(*session_keys_, getParaValidatorIndex(session_info_.validators))
      .WillOnce(Return(1));

  ASSERT_OUTCOME_SUCCESS(info, runtime_info_->get_session_info_by_index(parent, 4));
  EXPECT_EQ(info.session_info, session_info_);
  EXPECT_EQ(info.validator_info.our_index, 1);
  EXPECT_EQ(info.validator_info.our_group, 1);

  // any block does for a cached session
  ASSERT_OUTCOME_SUCCESS(
      cached, runtime_info_->get_session_info_by_index("other"_hash256, 4));
  EXPECT_EQ(cached, info);
}

/**
 * @given session unknown to the runtime
 * @when session info is requested
 * @then `NoSuchSession` is returned
 */
TEST_F(RuntimeInfoTest, MissingSession) {
  EXPECT_CALL(*api_, session_info(parent, 4))
      .WillOnce(Return(std::optional<SessionInfo>{}));

  EXPECT_EC(runtime_info_->get_session_info_by_index(parent, 4),
            SessionObtainingError::NoSuchSession);
}

/**
 * @given node with a validator key, which is not in the session
 * @when session info is requested
 * @then neither our index nor group are known
 */
TEST_F(RuntimeInfoTest, NotValidatorInSession) {
  runtime_info_ = std::make_unique<RuntimeInfoImpl>(
      api_, std::make_shared<SessionKeysImpl>(validator(9)), config_);
  EXPECT_CALL(*api_, session_info(parent, 4))
      .WillOnce(Return(std::optional<SessionInfo>{session_info_}));

  ASSERT_OUTCOME_SUCCESS(info, runtime_info_->get_session_info_by_index(parent, 4));
  EXPECT_EQ(info.validator_info.our_index, std::nullopt);
  EXPECT_EQ(info.validator_info.our_group, std::nullopt);
}

/**
 * @given node being validator #0 according to its key
 * @when session info is requested
 * @then our index and group are found
 */
TEST_F(RuntimeInfoTest, OurKeyIsFound) {
  runtime_info_ = std::make_unique<RuntimeInfoImpl>(
      api_, std::make_shared<SessionKeysImpl>(validator(1)), config_);
  EXPECT_CALL(*api_, session_info(parent, 4))
      .WillOnce(Return(std::optional<SessionInfo>{session_info_}));

  ASSERT_OUTCOME_SUCCESS(info, runtime_info_->get_session_info_by_index(parent, 4));
  EXPECT_EQ(info.validator_info.our_index, 0);
  EXPECT_EQ(info.validator_info.our_group, 0);
}
