/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

#include <gtest/gtest.h>
#include "testutil/outcome.hpp"

using namespace slotwatch::common;

/**
 * @given hex string
 * @when create blob object from this string using fromHex method
 * @then blob object is created and contains expected byte representation of the
 * hex string
 */
TEST(BlobTest, CreateFromValidHex) {
  std::array<byte_t, 2> expected{0, 255};
  EXPECT_OUTCOME_TRUE(blob, Blob<2>::fromHex("00ff"));
  EXPECT_EQ(blob, Blob<2>{expected});
}

/**
 * @given non hex string
 * @when try to create a Blob using fromHex on that string
 * @then error is returned
 */
TEST(BlobTest, CreateFromNonHex) {
  EXPECT_OUTCOME_FALSE_1(Blob<2>::fromHex("nothex"));
}

/**
 * @given hex string of a different length than the blob
 * @when try to create a Blob using fromHex on that string
 * @then INCORRECT_LENGTH error is returned
 */
TEST(BlobTest, CreateFromWrongLengthHex) {
  EXPECT_EC(Blob<2>::fromHex("00ff00"), BlobError::INCORRECT_LENGTH);
}

/**
 * @given 0x prefixed hex string
 * @when blob is created with fromHexWithPrefix
 * @then toHex0x returns the same string
 */
TEST(BlobTest, HexWithPrefixRoundTrip) {
  std::string hex =
      "0xd43593c715fdd31c61141abd04a99fd6822c8558854ccde39a5684e7a56da27d";
  EXPECT_OUTCOME_TRUE(blob, Hash256::fromHexWithPrefix(hex));
  EXPECT_EQ(blob.toHex0x(), hex);
  EXPECT_EQ(blob[0], 0xd4);
}

/**
 * @given hash
 * @when it is formatted in short and long forms
 * @then short form keeps only both ends of the hex
 */
TEST(BlobTest, Format) {
  EXPECT_OUTCOME_TRUE(
      blob,
      Hash256::fromHex(
          "d43593c715fdd31c61141abd04a99fd6822c8558854ccde39a5684e7a56da27d"));
  EXPECT_EQ(fmt::format("{:s}", blob), "0xd435…a27d");
  EXPECT_EQ(fmt::format("{}", blob), blob.toHex0x());
}
