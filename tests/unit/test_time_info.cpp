/**
 * @file test_time_info.cpp
 * @brief Unit tests for timestamp reconstruction
 *
 * Tests cover:
 * - Version 1 and 2 field composition
 * - Big- and little-endian layouts
 * - Exact chunked addition across the full 60-bit range
 * - Alternate epochs and steps
 * - UTC formatting
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <uuidinfo/core/time_info.hpp>
#include <uuidinfo/core/uuid.hpp>

#include <chrono>
#include <cstdint>
#include <limits>
#include <stdexcept>

using namespace uuidinfo::core;

namespace {

const uint64_t kMaxTicks = (uint64_t{1} << 60) - 1;

uint64_t ticksSince(UuidTime time, UuidTime base) {
    return static_cast<uint64_t>((time - base).count());
}

// Version 1 UUID whose 60-bit time is `ticks` in big-endian layout.
Uuid v1WithTicks(uint64_t ticks) {
    Uuid::Bytes b{};
    b[0] = static_cast<uint8_t>(ticks >> 24);
    b[1] = static_cast<uint8_t>(ticks >> 16);
    b[2] = static_cast<uint8_t>(ticks >> 8);
    b[3] = static_cast<uint8_t>(ticks);
    b[4] = static_cast<uint8_t>(ticks >> 40);
    b[5] = static_cast<uint8_t>(ticks >> 32);
    b[6] = static_cast<uint8_t>(0x10 | ((ticks >> 56) & 0x0f));
    b[7] = static_cast<uint8_t>(ticks >> 48);
    b[8] = 0x80;
    return Uuid(b);
}

}  // namespace

class TimeInfoTest : public ::testing::Test {
protected:
    const TimeEpoch epoch_ = TimeEpoch::gregorian();
};

// =============================================================================
// Field Composition
// =============================================================================

TEST_F(TimeInfoTest, Version1BigEndian) {
    Uuid id = Uuid::parse("8be4df61-93ca-11d2-aa0d-00e098032b8c");
    TimeInfo info = reconstructTime(id);

    EXPECT_EQ(info.ticks, 0x1d293ca8be4df61ULL);
    EXPECT_EQ(info.clock_sequence, 0x2a0d);
    EXPECT_EQ(info.domain, 0);
    EXPECT_EQ(info.local_id, 0u);
    EXPECT_EQ(ticksSince(info.timestamp, epoch_.base), info.ticks);
    EXPECT_EQ(formatUtc(info.timestamp), "1998-12-15 03:02:08.6874977 UTC");
}

TEST_F(TimeInfoTest, Version2UsesTimeLowAsLocalId) {
    Uuid id = Uuid::parse("8be4df61-93ca-21d2-aa0d-00e098032b8c");
    TimeInfo info = reconstructTime(id);

    EXPECT_EQ(info.ticks, 0x1d293ca00000000ULL);
    EXPECT_EQ(info.local_id, 0x8be4df61u);
    EXPECT_EQ(info.domain, 0x0d);
    EXPECT_EQ(info.clock_sequence, 0x2a);
    EXPECT_EQ(formatUtc(info.timestamp), "1998-12-15 02:58:13.9842560 UTC");
}

TEST_F(TimeInfoTest, Version1LittleEndian) {
    Uuid id = Uuid::parse("8be4df61-93ca-11d2-aa0d-00e098032b8c");
    TimeInfo info = reconstructTime(id, ByteOrder::LittleEndian);

    const uint64_t low = 0x61dfe48bULL;
    const uint64_t mid = 0xca93ULL;
    const uint64_t high = 0x01ULL | (0xd2ULL << 4);
    EXPECT_EQ(info.ticks, low + (mid << 32) + (high << 48));
    EXPECT_EQ(info.clock_sequence, 0x2a0d);
    EXPECT_EQ(ticksSince(info.timestamp, epoch_.base), info.ticks);
}

TEST_F(TimeInfoTest, Version2LittleEndianLocalId) {
    Uuid id = Uuid::parse("8be4df61-93ca-21d2-aa0d-00e098032b8c");
    TimeInfo info = reconstructTime(id, ByteOrder::LittleEndian);
    EXPECT_EQ(info.local_id, 0x61dfe48bu);
}

TEST_F(TimeInfoTest, ClockSequenceFromOtherSample) {
    TimeInfo info = reconstructTime(Uuid::parse("cab00d1e-cab0-10d1-beca-00decab00d1e"));
    EXPECT_EQ(info.clock_sequence, 0x3eca);
    EXPECT_EQ(info.ticks, 0x0d1cab0cab00d1eULL);
}

TEST_F(TimeInfoTest, VersionNibbleNeverLeaksIntoTime) {
    Uuid::Bytes b{};
    b[Uuid::kVersionIndex] = 0x10;
    b[Uuid::kVariantIndex] = 0x80;
    TimeInfo info = reconstructTime(Uuid(b));
    EXPECT_EQ(info.ticks, 0u);
}

TEST_F(TimeInfoTest, OtherVersionsAreRejected) {
    EXPECT_THROW(reconstructTime(Uuid()), std::invalid_argument);
    EXPECT_THROW(reconstructTime(Uuid::parse("8be4df61-93ca-41d2-aa0d-00e098032b8c")),
                 std::invalid_argument);
}

// =============================================================================
// Epoch Resolution
// =============================================================================

TEST_F(TimeInfoTest, ZeroTicksIsTheEpoch) {
    TimeInfo info = reconstructTime(v1WithTicks(0));
    EXPECT_EQ(info.timestamp, epoch_.base);
    EXPECT_EQ(formatUtc(info.timestamp), "1582-10-15 00:00:00.0000000 UTC");
}

TEST_F(TimeInfoTest, GregorianEpochMatchesUnixOffset) {
    EXPECT_EQ(epoch_.base.time_since_epoch().count(), -122192928000000000LL);
    EXPECT_EQ(epoch_.max_step.count(), std::numeric_limits<int64_t>::max() / 100);
}

TEST_F(TimeInfoTest, MaximumTicksResolveExactly) {
    ASSERT_GT(kMaxTicks, static_cast<uint64_t>(epoch_.max_step.count()));

    TimeInfo info = reconstructTime(v1WithTicks(kMaxTicks));
    EXPECT_EQ(info.ticks, kMaxTicks);
    EXPECT_EQ(ticksSince(info.timestamp, epoch_.base), kMaxTicks);
    EXPECT_EQ(formatUtc(info.timestamp), "5236-03-31 21:21:00.6846975 UTC");
}

TEST_F(TimeInfoTest, ChunkedAdditionIsExact) {
    const uint64_t samples[] = {
        0, 1, 9999999, 10000000,
        static_cast<uint64_t>(TimeEpoch::kMaxNanosecondStep) - 1,
        static_cast<uint64_t>(TimeEpoch::kMaxNanosecondStep),
        static_cast<uint64_t>(TimeEpoch::kMaxNanosecondStep) + 1,
        static_cast<uint64_t>(TimeEpoch::kMaxNanosecondStep) * 7 + 12345,
        0x1d293ca8be4df61ULL,
        kMaxTicks,
    };
    for (uint64_t ticks : samples) {
        UuidTime t = advanceTicks(epoch_.base, ticks, epoch_.max_step);
        EXPECT_EQ(ticksSince(t, epoch_.base), ticks) << "ticks " << ticks;
    }
}

TEST_F(TimeInfoTest, SmallStepsGiveTheSameResult) {
    const uint64_t ticks = 123456789;
    UuidTime direct = advanceTicks(epoch_.base, ticks, epoch_.max_step);
    EXPECT_EQ(advanceTicks(epoch_.base, ticks, Ticks(1000)), direct);
    EXPECT_EQ(advanceTicks(epoch_.base, ticks, Ticks(ticks)), direct);
    EXPECT_EQ(advanceTicks(epoch_.base, ticks, Ticks(ticks - 1)), direct);
}

TEST_F(TimeInfoTest, AlternateEpoch) {
    // 2020-01-01T00:00:00Z
    TimeEpoch custom{UuidTime(std::chrono::seconds(1577836800)), Ticks(10000000)};
    TimeInfo info = reconstructTime(v1WithTicks(15 * 10000000ULL + 5), ByteOrder::BigEndian, custom);
    EXPECT_EQ(formatUtc(info.timestamp), "2020-01-01 00:00:15.0000005 UTC");
}

TEST_F(TimeInfoTest, InvalidStepIsRejected) {
    EXPECT_THROW(advanceTicks(epoch_.base, 10, Ticks(0)), std::invalid_argument);
    EXPECT_THROW(advanceTicks(epoch_.base, 10, Ticks(-5)), std::invalid_argument);
}

TEST_F(TimeInfoTest, OverflowIsReported) {
    UuidTime nearMax(Ticks(std::numeric_limits<int64_t>::max() - 10));
    EXPECT_NO_THROW(advanceTicks(nearMax, 10, Ticks(3)));
    EXPECT_THROW(advanceTicks(nearMax, 11, Ticks(3)), std::overflow_error);
}

// =============================================================================
// Formatting
// =============================================================================

TEST_F(TimeInfoTest, FormatUnixEpochAndFraction) {
    EXPECT_EQ(formatUtc(UuidTime(Ticks(0))), "1970-01-01 00:00:00.0000000 UTC");
    EXPECT_EQ(formatUtc(UuidTime(Ticks(-1))), "1969-12-31 23:59:59.9999999 UTC");
}
