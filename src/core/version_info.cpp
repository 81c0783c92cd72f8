/**
 * @file version_info.cpp
 * @brief Version-specific decoding implementation.
 *
 * @copyright Copyright (c) 2024 uuidinfo Contributors
 * @license MIT License
 */

#include "uuidinfo/core/version_info.hpp"

#include <type_traits>

namespace uuidinfo {
namespace core {

VersionInfo decodeVersion(const Uuid& uuid, const DecodeOptions& options) {
    const int version = uuid.version();

    switch (version) {
        case 0:
            return NullVersion{};
        case 1: {
            const TimeInfo t = reconstructTime(uuid, options.byte_order, options.epoch);
            TimeBasedVersion v;
            v.timestamp = t.timestamp;
            v.ticks = t.ticks;
            v.clock_sequence = t.clock_sequence;
            v.node = *uuid.nodeId();
            return v;
        }
        case 2: {
            const TimeInfo t = reconstructTime(uuid, options.byte_order, options.epoch);
            DceSecurityVersion v;
            v.timestamp = t.timestamp;
            v.ticks = t.ticks;
            v.clock_sequence = static_cast<uint8_t>(t.clock_sequence);
            v.domain = t.domain;
            v.local_id = t.local_id;
            v.node = *uuid.nodeId();
            return v;
        }
        case 3:
            return NameBasedMd5Version{uuid.payload()};
        case 4:
            return RandomVersion{uuid.payload()};
        case 5:
            return NameBasedSha1Version{uuid.payload()};
        default:
            return UnknownVersion{version};
    }
}

int versionNumber(const VersionInfo& info) {
    return std::visit([](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, NullVersion>) {
            return 0;
        } else if constexpr (std::is_same_v<T, TimeBasedVersion>) {
            return 1;
        } else if constexpr (std::is_same_v<T, DceSecurityVersion>) {
            return 2;
        } else if constexpr (std::is_same_v<T, NameBasedMd5Version>) {
            return 3;
        } else if constexpr (std::is_same_v<T, RandomVersion>) {
            return 4;
        } else if constexpr (std::is_same_v<T, NameBasedSha1Version>) {
            return 5;
        } else {
            return v.number;
        }
    }, info);
}

std::string versionLabel(int version) {
    if (version < 0) {
        return "<Invalid_Version:" + std::to_string(version) + ">";
    }
    if (version == 0) {
        return "Version-Null_UUID";
    }
    return "Version-" + std::to_string(version);
}

}  // namespace core
}  // namespace uuidinfo
