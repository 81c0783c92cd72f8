/**
 * @file time_info.cpp
 * @brief Timestamp reconstruction implementation.
 *
 * @copyright Copyright (c) 2024 uuidinfo Contributors
 * @license MIT License
 */

#include "uuidinfo/core/time_info.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace uuidinfo {
namespace core {

namespace {

struct TimeFields {
    uint32_t low = 0;
    uint16_t mid = 0;
    uint16_t high = 0;  // 12 bits, version nibble removed
};

TimeFields readTimeFields(const Uuid& uuid, ByteOrder order) {
    TimeFields f;
    const bool le = order == ByteOrder::LittleEndian;

    uint32_t multiplier = 1;
    for (size_t i = 0; i < Uuid::kTimeMidIndex; ++i) {
        const uint32_t v = uuid[i];
        if (le) {
            f.low += v * multiplier;
            multiplier <<= 8;
        } else {
            f.low = (f.low << 8) + v;
        }
    }

    const size_t m = Uuid::kTimeMidIndex;
    if (le) {
        f.mid = static_cast<uint16_t>(uuid[m] | (uuid[m + 1] << 8));
    } else {
        f.mid = static_cast<uint16_t>((uuid[m] << 8) | uuid[m + 1]);
    }

    // The version nibble is always the high half of byte 6. In the
    // little-endian layout byte 7 holds the upper eight of the 12 bits.
    const size_t h = Uuid::kVersionIndex;
    const uint16_t hiNibble = uuid[h] & 0x0f;
    if (le) {
        f.high = static_cast<uint16_t>(hiNibble | (uuid[h + 1] << 4));
    } else {
        f.high = static_cast<uint16_t>((hiNibble << 8) | uuid[h + 1]);
    }

    return f;
}

}  // namespace

UuidTime advanceTicks(UuidTime base, uint64_t ticks, Ticks max_step) {
    if (max_step.count() <= 0) {
        throw std::invalid_argument("time step must be positive, got " +
                                    std::to_string(max_step.count()));
    }

    const uint64_t step = static_cast<uint64_t>(max_step.count());
    UuidTime time = base;
    uint64_t remaining = ticks;

    while (remaining > 0) {
        const uint64_t chunk = remaining > step ? step : remaining;
        const int64_t current = time.time_since_epoch().count();
        if (current > std::numeric_limits<int64_t>::max() - static_cast<int64_t>(chunk)) {
            throw std::overflow_error("UUID time out of range: " + std::to_string(ticks) +
                                      " ticks past base " + std::to_string(base.time_since_epoch().count()));
        }
        time += Ticks(static_cast<int64_t>(chunk));
        remaining -= chunk;
    }

    return time;
}

TimeInfo reconstructTime(const Uuid& uuid, ByteOrder order, const TimeEpoch& epoch) {
    const int version = uuid.version();
    if (version != 1 && version != 2) {
        throw std::invalid_argument("time fields are only defined for version 1 and 2 UUIDs, got version " +
                                    std::to_string(version));
    }

    const TimeFields f = readTimeFields(uuid, order);

    TimeInfo info;
    info.ticks = (static_cast<uint64_t>(f.mid) << 32) + (static_cast<uint64_t>(f.high) << 48);

    const uint8_t seqHigh = uuid.maskVariant();
    const uint8_t seqLow = uuid[Uuid::kVariantIndex + 1];

    if (version == 1) {
        info.ticks += f.low;
        info.clock_sequence = static_cast<uint16_t>((seqHigh << 8) + seqLow);
    } else {
        info.local_id = f.low;
        info.domain = seqLow;
        info.clock_sequence = seqHigh;
    }

    info.timestamp = advanceTicks(epoch.base, info.ticks, epoch.max_step);
    return info;
}

std::string formatUtc(UuidTime time) {
    const auto secs = std::chrono::floor<std::chrono::seconds>(time);
    const Ticks fraction = time - secs;
    const std::time_t tt = static_cast<std::time_t>(secs.time_since_epoch().count());

    std::tm tm_buf{};
#ifdef _WIN32
    if (gmtime_s(&tm_buf, &tt) != 0) {
#else
    if (gmtime_r(&tt, &tm_buf) == nullptr) {
#endif
        throw std::overflow_error("time not representable as a calendar date: " +
                                  std::to_string(time.time_since_epoch().count()) + " ticks");
    }

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(7) << fraction.count()
        << " UTC";
    return oss.str();
}

}  // namespace core
}  // namespace uuidinfo
