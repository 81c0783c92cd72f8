/**
 * @file time_info.hpp
 * @brief Timestamp and clock-sequence reconstruction for version 1 and 2 UUIDs.
 *
 * Time-based UUIDs carry a 60-bit count of 100-nanosecond intervals
 * since 1582-10-15T00:00:00Z split over time_low, time_mid and
 * time_hi_and_version. The count spans more than 3600 years, which does
 * not fit a nanosecond int64 duration; times are therefore kept in
 * 100 ns ticks and added to the epoch in bounded steps.
 *
 * @copyright Copyright (c) 2024 uuidinfo Contributors
 * @license MIT License
 */

#pragma once

#include "uuidinfo/core/export.hpp"
#include "uuidinfo/core/uuid.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <ratio>
#include <string>

namespace uuidinfo {
namespace core {

/// One UUID clock tick: 100 ns.
using Ticks = std::chrono::duration<int64_t, std::ratio<1, 10000000>>;

/// UTC wall-clock time at tick resolution.
using UuidTime = std::chrono::time_point<std::chrono::system_clock, Ticks>;

/**
 * @enum ByteOrder
 * @brief Field layout of time_low, time_mid and time_hi.
 */
enum class ByteOrder {
    BigEndian,    ///< RFC 4122 network order
    LittleEndian  ///< Microsoft GUID in-memory order
};

/**
 * @struct TimeEpoch
 * @brief Base time and addition step used to resolve tick counts.
 */
struct UUIDINFO_CORE_API TimeEpoch {
    /// Seconds from the Unix epoch to 1582-10-15T00:00:00Z.
    static constexpr int64_t kGregorianOffsetSeconds = -12219292800LL;

    /// Largest nanosecond int64 duration, in 100 ns units.
    static constexpr int64_t kMaxNanosecondStep = std::numeric_limits<int64_t>::max() / 100;

    UuidTime base;   ///< Time of tick 0
    Ticks max_step;  ///< Largest single addition applied to `base`

    /**
     * @brief The RFC 4122 epoch with the default step.
     */
    static TimeEpoch gregorian() {
        return TimeEpoch{UuidTime(std::chrono::seconds(kGregorianOffsetSeconds)),
                         Ticks(kMaxNanosecondStep)};
    }
};

/**
 * @struct TimeInfo
 * @brief Decoded time fields of a version 1 or 2 UUID.
 */
struct TimeInfo {
    UuidTime timestamp;           ///< Absolute UTC time
    uint64_t ticks = 0;           ///< 60-bit count since the epoch
    uint16_t clock_sequence = 0;  ///< 14 bits for v1, 8 bits for v2
    uint8_t domain = 0;           ///< DCE domain (v2 only)
    uint32_t local_id = 0;        ///< DCE local identifier, e.g. UID (v2 only)
};

/**
 * @brief Add a tick count to a time in steps of at most `max_step`.
 *
 * The result is exact: (result - base) equals `ticks`.
 *
 * @throws std::invalid_argument if max_step is not positive
 * @throws std::overflow_error if the result is not representable
 */
UUIDINFO_CORE_API UuidTime advanceTicks(UuidTime base, uint64_t ticks, Ticks max_step);

/**
 * @brief Reconstruct timestamp, clock sequence, domain and local id.
 *
 * Version 1 combines all three time fields. Version 2 (DCE Security)
 * reuses time_low as the local identifier and byte 9 as the domain, so
 * only time_mid and time_hi contribute and the clock sequence is the
 * masked byte 8 alone.
 *
 * @throws std::invalid_argument if uuid.version() is not 1 or 2
 */
UUIDINFO_CORE_API TimeInfo reconstructTime(const Uuid& uuid,
                                           ByteOrder order = ByteOrder::BigEndian,
                                           const TimeEpoch& epoch = TimeEpoch::gregorian());

/**
 * @brief Render as "YYYY-MM-DD HH:MM:SS.fffffff UTC".
 */
UUIDINFO_CORE_API std::string formatUtc(UuidTime time);

}  // namespace core
}  // namespace uuidinfo
