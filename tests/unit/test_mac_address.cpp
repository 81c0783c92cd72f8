/**
 * @file test_mac_address.cpp
 * @brief Unit tests for MAC address parsing and formatting
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <uuidinfo/utils/error_chain.hpp>
#include <uuidinfo/utils/hex.hpp>
#include <uuidinfo/utils/mac_address.hpp>

#include <exception>
#include <optional>

using namespace uuidinfo::utils;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace {

MacAddress sample() {
    return MacAddress(MacAddress::Bytes{0x00, 0xe0, 0x98, 0x03, 0x2b, 0x8c});
}

}  // namespace

TEST(MacAddressTest, DefaultFormatIsLowercaseColon) {
    EXPECT_EQ(sample().toString(), "00:e0:98:03:2b:8c");
}

TEST(MacAddressTest, CustomDelimiterAndCase) {
    EXPECT_EQ(sample().toString("-", true), "00-E0-98-03-2B-8C");
    EXPECT_EQ(sample().toString("", false), "00e098032b8c");
}

TEST(MacAddressTest, AbsentAddressFormatsAsNullSentinel) {
    EXPECT_EQ(formatMac(std::nullopt), "<Null_MAC_Address>");
    EXPECT_EQ(formatMac(sample(), ".", true), "00.E0.98.03.2B.8C");
}

TEST(MacAddressTest, ParsesColonDashAndDotForms) {
    EXPECT_EQ(MacAddress::parse("00:e0:98:03:2b:8c"), sample());
    EXPECT_EQ(MacAddress::parse("00-E0-98-03-2B-8C"), sample());
    EXPECT_EQ(MacAddress::parse("00e0.9803.2b8c"), sample());
}

TEST(MacAddressTest, RejectsWrongShape) {
    EXPECT_THROW(MacAddress::parse(""), MacParseError);
    EXPECT_THROW(MacAddress::parse("00:e0:98:03:2b"), MacParseError);
    EXPECT_THROW(MacAddress::parse("00:e0-98:03:2b:8c"), MacParseError);
    EXPECT_THROW(MacAddress::parse("000:e0:98:03:2b:8"), MacParseError);
    EXPECT_THROW(MacAddress::parse("00e0.9803.2b8c.0000"), MacParseError);
}

TEST(MacAddressTest, BadHexGroupKeepsCause) {
    try {
        MacAddress::parse("00:e0:98:zz:2b:8c");
        FAIL() << "expected MacParseError";
    } catch (const MacParseError& e) {
        EXPECT_EQ(e.input(), "00:e0:98:zz:2b:8c");
        EXPECT_EQ(exceptionChain(e).size(), 2u);
        EXPECT_THAT(describeException(e), HasSubstr("invalid hex byte 'z'"));

        bool nested = false;
        try {
            std::rethrow_if_nested(e);
        } catch (const HexError&) {
            nested = true;
        }
        EXPECT_TRUE(nested);
    }
}

TEST(MacAddressTest, FormatParsesBack) {
    MacAddress mac = sample();
    EXPECT_EQ(MacAddress::parse(mac.toString("-", true)), mac);
    EXPECT_THAT(mac.bytes(), ElementsAre(0x00, 0xe0, 0x98, 0x03, 0x2b, 0x8c));
}
