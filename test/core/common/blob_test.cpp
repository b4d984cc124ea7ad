/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

#include <unordered_set>

#include <gtest/gtest.h>

#include "primitives/authority_discovery_id.hpp"
#include "testutil/outcome.hpp"

using namespace tribune::common;
using tribune::primitives::AuthorityDiscoveryId;

/**
 * @given hex string
 * @when create blob object from this string using fromHex method
 * @then blob object is created and contains expected byte representation of the
 * hex string
 */
TEST(BlobTest, CreateFromValidHex) {
  std::string hex32 = "00ff";
  std::array<byte_t, 2> expected{0, 255};

  EXPECT_OUTCOME_TRUE(blob, Blob<2>::fromHex(hex32));
  EXPECT_EQ(blob, expected);
}

/**
 * @given non hex string
 * @when try to create a Blob using fromHex on that string
 * @then error is returned
 */
TEST(BlobTest, CreateFromNonHex) {
  EXPECT_EC(Blob<2>::fromHex("nothex"), UnhexError::NON_HEX_INPUT);
}

/**
 * @given string with odd length
 * @when try to create a Blob using fromHex on that string
 * @then error is returned
 */
TEST(BlobTest, CreateFromOddLengthHex) {
  EXPECT_EC(Blob<2>::fromHex("0a1"), UnhexError::NOT_ENOUGH_INPUT);
}

/**
 * @given hex string of wrong length
 * @when try to create a Blob using fromHex on that string
 * @then error is returned
 */
TEST(BlobTest, CreateFromWrongLengthHex) {
  EXPECT_EC(Blob<2>::fromHex("00ff00"), BlobError::INCORRECT_LENGTH);
}

/**
 * @given bytes
 * @when blob is created from them
 * @then toHex() returns their hex representation
 */
TEST(BlobTest, ToHexTest) {
  std::array<uint8_t, 5> bytes{'h', 'e', 'l', 'l', 'o'};

  EXPECT_OUTCOME_TRUE(blob, Blob<5>::fromSpan(bytes));
  EXPECT_EQ(blob.toHex(), "68656c6c6f");
}

/**
 * @given blob of 32 bytes
 * @when it is formatted
 * @then short form is used by default and long form on request
 */
TEST(BlobTest, Format) {
  Hash256 hash;
  hash[0] = 0xab;
  hash[31] = 0xcd;

  EXPECT_EQ(fmt::format("{}", hash), "0xab00…00cd");
  EXPECT_EQ(fmt::format("{:l}", hash), "0x" + hash.toHex());
}

/**
 * @given authority ids made of the same and of different bytes
 * @when they are put in a hash set
 * @then equal ids are stored once
 */
TEST(BlobTest, StrictTypedefIsHashable) {
  EXPECT_OUTCOME_TRUE(
      id_1,
      AuthorityDiscoveryId::fromHex(
          "0101010101010101010101010101010101010101010101010101010101010101"));
  EXPECT_OUTCOME_TRUE(
      id_2,
      AuthorityDiscoveryId::fromHex(
          "0202020202020202020202020202020202020202020202020202020202020202"));

  std::unordered_set<AuthorityDiscoveryId> ids{id_1, id_2, id_1};
  EXPECT_EQ(ids.size(), 2);
  EXPECT_EQ(fmt::format("{}", id_2), "0x0202…0202");
}
