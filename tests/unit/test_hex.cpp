/**
 * @file test_hex.cpp
 * @brief Unit tests for the hexadecimal codec
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <uuidinfo/utils/hex.hpp>

#include <cstdint>
#include <vector>

using namespace uuidinfo::utils;
using ::testing::ElementsAre;

TEST(HexTest, DecodesMixedCase) {
    EXPECT_THAT(hexDecode("00aBcDeF"), ElementsAre(0x00, 0xab, 0xcd, 0xef));
}

TEST(HexTest, EmptyInputDecodesToNothing) {
    EXPECT_TRUE(hexDecode("").empty());
}

TEST(HexTest, InvalidCharacterReportsOffset) {
    try {
        hexDecode("0g");
        FAIL() << "expected HexError";
    } catch (const HexError& e) {
        EXPECT_EQ(e.kind(), HexError::Kind::InvalidByte);
        EXPECT_EQ(e.offset(), 1u);
        EXPECT_EQ(e.character(), 'g');
    }
}

TEST(HexTest, OddLengthIsRejected) {
    try {
        hexDecode("abc");
        FAIL() << "expected HexError";
    } catch (const HexError& e) {
        EXPECT_EQ(e.kind(), HexError::Kind::OddLength);
    }
}

TEST(HexTest, InvalidTrailingDigitWinsOverOddLength) {
    try {
        hexDecode("abz");
        FAIL() << "expected HexError";
    } catch (const HexError& e) {
        EXPECT_EQ(e.kind(), HexError::Kind::InvalidByte);
        EXPECT_EQ(e.offset(), 2u);
    }
}

TEST(HexTest, EncodesLowercase) {
    const uint8_t data[] = {0x00, 0xe0, 0x98, 0xff};
    EXPECT_EQ(hexEncode(data, sizeof(data)), "00e098ff");
}

TEST(HexTest, EncodesJoined) {
    const uint8_t data[] = {0x8b, 0xe4, 0x0f};
    EXPECT_EQ(hexEncodeJoined(data, 3, ":"), "8b:e4:0f");
    EXPECT_EQ(hexEncodeJoined(data, 1, ":"), "8b");
    EXPECT_EQ(hexEncodeJoined(data, 0, ":"), "");
}
