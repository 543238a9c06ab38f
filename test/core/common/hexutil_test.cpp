/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <gtest/gtest.h>
#include "common/buffer.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using namespace slotwatch::common;
using namespace std::string_literals;

/**
 * @given Array of bytes
 * @when hex it
 * @then hex matches expected lowercase encoding
 */
TEST(Common, Hexutil_Hex) {
  auto bin = "00010204081020ff"_unhex;
  ASSERT_EQ(hex_lower(bin), "00010204081020ff"s);
  ASSERT_EQ(hex_lower_0x(bin), "0x00010204081020ff"s);
}

/**
 * @given Hexencoded string of even length in mixed case
 * @when unhex
 * @then no error, result matches expected value
 */
TEST(Common, Hexutil_UnhexEven) {
  EXPECT_OUTCOME_TRUE(actual, unhex("00010204081020Ff"));
  std::vector<uint8_t> expected{0, 1, 2, 4, 8, 16, 32, 255};
  ASSERT_EQ(actual, expected);
}

/**
 * @given Hexencoded string of odd length
 * @when unhex
 * @then unhex result contains error
 */
TEST(Common, Hexutil_UnhexOdd) {
  EXPECT_EC(unhex("0"), UnhexError::NOT_ENOUGH_INPUT);
}

/**
 * @given Hexencoded string with non-hex letter
 * @when unhex
 * @then unhex result contains error
 */
TEST(Common, Hexutil_UnhexInvalid) {
  EXPECT_EC(unhex("keks"), UnhexError::NON_HEX_INPUT);
}

/**
 * @given hex strings with and without 0x prefix
 * @when unhexWith0x
 * @then only the prefixed one is accepted
 */
TEST(Common, Hexutil_UnhexWith0x) {
  EXPECT_OUTCOME_TRUE(bytes, unhexWith0x("0x0aff"));
  ASSERT_EQ(bytes, (std::vector<uint8_t>{0x0a, 0xff}));
  EXPECT_EC(unhexWith0x("0aff"), UnhexError::MISSING_0X_PREFIX);
}

struct UnhexNumber32Test
    : public ::testing::TestWithParam<std::pair<std::string, size_t>> {};

namespace {
  std::pair<std::string, size_t> makePair(std::string s, size_t v) {
    return std::make_pair(std::move(s), v);
  }
}  // namespace

TEST_P(UnhexNumber32Test, Unhex32Success) {
  auto &&[hex, val] = GetParam();
  EXPECT_OUTCOME_TRUE(decimal, unhexNumber<uint32_t>(hex));
  EXPECT_EQ(decimal, val);
}

INSTANTIATE_TEST_SUITE_P(UnhexNumberTestCases,
                         UnhexNumber32Test,
                         ::testing::Values(makePair("0x64", 100),
                                           makePair("0x1", 1),
                                           makePair("0x0", 0),
                                           makePair("0xbc614e", 12345678),
                                           makePair("0xFFFFFFFF", 4294967295)));

TEST(UnhexNumberTest, Overflow) {
  EXPECT_EC(unhexNumber<uint8_t>("0x01FF"), UnhexError::VALUE_OUT_OF_RANGE);
  EXPECT_EC(unhexNumber<uint32_t>("0x100000000"),
            UnhexError::VALUE_OUT_OF_RANGE);
}

TEST(UnhexNumberTest, WrongFormat) {
  EXPECT_EC(unhexNumber<uint8_t>("64"), UnhexError::MISSING_0X_PREFIX);
  EXPECT_EC(unhexNumber<uint8_t>("0x"), UnhexError::NOT_ENOUGH_INPUT);
  EXPECT_EC(unhexNumber<uint8_t>("0xg1"), UnhexError::NON_HEX_INPUT);
}
