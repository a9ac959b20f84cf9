/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

#include <unordered_set>

#include <gtest/gtest.h>

#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using namespace vigil::common;

/**
 * @given hex string
 * @when create blob object from this string using fromHex method
 * @then blob object is created and contains expected byte representation of the
 * hex string
 */
TEST(BlobTest, CreateFromValidHex) {
  std::array<byte_t, 2> expected{0, 255};

  EXPECT_OUTCOME_TRUE(blob, Blob<2>::fromHex("00ff"));
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
 * @given hex string of a wrong length
 * @when try to create a Blob using fromHex on that string
 * @then error is returned
 */
TEST(BlobTest, CreateFromWrongLengthHex) {
  EXPECT_EC(Blob<2>::fromHex("00ff00"), BlobError::INCORRECT_LENGTH);
}

/**
 * @given hex string with and without 0x prefix
 * @when a Blob is created using fromHexWithPrefix
 * @then only the prefixed string is accepted
 */
TEST(BlobTest, CreateFromHexWithPrefix) {
  EXPECT_OUTCOME_TRUE(blob, Blob<2>::fromHexWithPrefix("0x0102"));
  EXPECT_EQ(blob, (std::array<byte_t, 2>{1, 2}));

  EXPECT_EC(Blob<2>::fromHexWithPrefix("0102"), UnhexError::MISSING_0X_PREFIX);
}

/**
 * @given blob made of bytes
 * @when it is converted to hex
 * @then lowercase hex of the bytes is returned
 */
TEST(BlobTest, ToHex) {
  EXPECT_OUTCOME_TRUE(blob, Blob<5>::fromSpan(std::vector<uint8_t>{
                                'h', 'e', 'l', 'l', 'o'}));
  EXPECT_EQ(blob.toHex(), "68656c6c6f");
}

/**
 * @given hash
 * @when it is formatted
 * @then short form shows the first and last two bytes, long form all of them
 */
TEST(BlobTest, Format) {
  Hash256 hash;
  hash[0] = 0xab;
  hash[1] = 0xcd;
  hash[30] = 0xef;
  hash[31] = 0x01;

  EXPECT_EQ(fmt::format("{}", hash), "0xabcd…ef01");
  EXPECT_EQ(fmt::format("{:l}", hash), "0x" + hash.toHex());
  EXPECT_EQ(fmt::format("{}", Blob<4>{{1, 2, 3, 4}}), "0x01020304");
}

/**
 * @given two hashes built from different literals
 * @when they are compared and hashed
 * @then they differ and are usable as keys
 */
TEST(BlobTest, HashLiteral) {
  auto a = "a"_hash256;
  auto b = "b"_hash256;
  EXPECT_NE(a, b);
  EXPECT_EQ(a[31], 'a');

  std::unordered_set<Hash256> set{a, b, a};
  EXPECT_EQ(set.size(), 2);
}
