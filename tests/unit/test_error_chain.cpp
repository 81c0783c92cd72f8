/**
 * @file test_error_chain.cpp
 * @brief Unit tests for nested exception flattening
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <uuidinfo/utils/error_chain.hpp>

#include <stdexcept>

using namespace uuidinfo::utils;
using ::testing::ElementsAre;

TEST(ErrorChainTest, SingleException) {
    std::runtime_error e("boom");
    EXPECT_THAT(exceptionChain(e), ElementsAre("boom"));
    EXPECT_EQ(describeException(e), "boom");
}

TEST(ErrorChainTest, NestedExceptionsOutermostFirst) {
    try {
        try {
            try {
                throw std::invalid_argument("innermost");
            } catch (...) {
                std::throw_with_nested(std::runtime_error("middle"));
            }
        } catch (...) {
            std::throw_with_nested(std::runtime_error("outer"));
        }
    } catch (const std::exception& e) {
        EXPECT_THAT(exceptionChain(e), ElementsAre("outer", "middle", "innermost"));
        EXPECT_EQ(describeException(e), "outer: middle: innermost");
    }
}
