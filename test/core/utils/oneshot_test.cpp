/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/oneshot.hpp"

#include <memory>

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using tribune::utils::Oneshot;
using tribune::utils::OneshotError;

using IntOneshot = Oneshot<int>;

/**
 * @given callback registered before sending
 * @when value is sent
 * @then the callback gets the value
 */
TEST(OneshotTest, SendAfterOnReady) {
  auto [tx, rx] = IntOneshot::create();
  std::optional<IntOneshot::Result> received;
  rx.onReady([&](IntOneshot::Result result) { received = result; });
  EXPECT_FALSE(received.has_value());

  EXPECT_OUTCOME_TRUE_1(tx.send(7));
  ASSERT_TRUE(received.has_value());
  ASSERT_TRUE(received->has_value());
  EXPECT_EQ(received->value(), 7);
}

/**
 * @given value sent before the callback is registered
 * @when the callback is registered
 * @then it is called immediately
 */
TEST(OneshotTest, OnReadyAfterSend) {
  auto [tx, rx] = IntOneshot::create();
  EXPECT_OUTCOME_TRUE_1(tx.send(3));

  std::optional<IntOneshot::Result> received;
  rx.onReady([&](IntOneshot::Result result) { received = result; });
  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(received->value(), 3);
}

/**
 * @given waiting receiver
 * @when the sender is dropped without sending
 * @then the receiver gets `CANCELED`
 */
TEST(OneshotTest, DroppedSenderCancels) {
  auto [tx, rx] = IntOneshot::create();
  std::optional<IntOneshot::Result> received;
  rx.onReady([&](IntOneshot::Result result) { received = result; });

  {
    auto dropped = std::move(tx);
  }
  ASSERT_TRUE(received.has_value());
  ASSERT_TRUE(received->has_error());
  EXPECT_EQ(received->error(), OneshotError::CANCELED);
}

/**
 * @given sender
 * @when the receiver is gone or the value was already sent
 * @then sending fails
 */
TEST(OneshotTest, SendFailures) {
  auto [tx, rx] = IntOneshot::create();
  EXPECT_FALSE(tx.isCanceled());
  {
    auto dropped = std::move(rx);
  }
  EXPECT_TRUE(tx.isCanceled());
  EXPECT_EC(tx.send(1), OneshotError::RECEIVER_DROPPED);
  EXPECT_EC(tx.send(2), OneshotError::ALREADY_SENT);
}

/**
 * @given receiver with a registered callback
 * @when the receiver is closed
 * @then the callback is released uncalled and the sender sees the receiver
 * gone
 */
TEST(OneshotTest, CloseReleasesCallback) {
  auto [tx, rx] = IntOneshot::create();
  auto token = std::make_shared<int>(0);
  std::weak_ptr<int> weak_token = token;
  bool called = false;
  rx.onReady([&called, token{std::move(token)}](IntOneshot::Result) {
    called = true;
  });
  EXPECT_FALSE(weak_token.expired());

  rx.close();
  EXPECT_TRUE(weak_token.expired());
  EXPECT_TRUE(tx.isCanceled());

  rx.onReady([&](IntOneshot::Result) { called = true; });
  EXPECT_EC(tx.send(1), OneshotError::RECEIVER_DROPPED);
  EXPECT_FALSE(called);
}
