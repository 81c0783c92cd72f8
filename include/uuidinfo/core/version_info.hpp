/**
 * @file version_info.hpp
 * @brief Version-specific decoding of a UUID into a tagged model.
 *
 * Each alternative of VersionInfo carries only the fields its version
 * defines: a node and time for versions 1 and 2, DCE domain and local id
 * for version 2, masked data for versions 3-5.
 *
 * @copyright Copyright (c) 2024 uuidinfo Contributors
 * @license MIT License
 */

#pragma once

#include "uuidinfo/core/export.hpp"
#include "uuidinfo/core/time_info.hpp"
#include "uuidinfo/core/uuid.hpp"
#include "uuidinfo/utils/mac_address.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace uuidinfo {
namespace core {

/// Version 0: the null UUID.
struct NullVersion {};

/// Version 1: time-based.
struct TimeBasedVersion {
    UuidTime timestamp;
    uint64_t ticks = 0;
    uint16_t clock_sequence = 0;
    utils::MacAddress node;
};

/// Version 2: DCE Security.
struct DceSecurityVersion {
    UuidTime timestamp;
    uint64_t ticks = 0;
    uint8_t clock_sequence = 0;
    uint8_t domain = 0;
    uint32_t local_id = 0;
    utils::MacAddress node;
};

/// Version 3: name-based, MD5.
struct NameBasedMd5Version {
    Uuid::Bytes hash;
};

/// Version 4: random.
struct RandomVersion {
    Uuid::Bytes random;
};

/// Version 5: name-based, SHA-1.
struct NameBasedSha1Version {
    Uuid::Bytes hash;
};

/// Versions 6-15, not decoded further.
struct UnknownVersion {
    int number = 0;
};

using VersionInfo = std::variant<NullVersion,
                                 TimeBasedVersion,
                                 DceSecurityVersion,
                                 NameBasedMd5Version,
                                 RandomVersion,
                                 NameBasedSha1Version,
                                 UnknownVersion>;

/**
 * @struct DecodeOptions
 * @brief How time fields are read and resolved.
 */
struct DecodeOptions {
    ByteOrder byte_order = ByteOrder::BigEndian;
    TimeEpoch epoch = TimeEpoch::gregorian();
};

/**
 * @brief Decode the version-specific fields of a UUID.
 */
UUIDINFO_CORE_API VersionInfo decodeVersion(const Uuid& uuid,
                                            const DecodeOptions& options = DecodeOptions());

/**
 * @brief The version number an alternative stands for.
 */
UUIDINFO_CORE_API int versionNumber(const VersionInfo& info);

/**
 * @brief "Version-Null_UUID" for 0, "Version-N" for positive numbers and
 * "<Invalid_Version:N>" for negative ones.
 */
UUIDINFO_CORE_API std::string versionLabel(int version);

}  // namespace core
}  // namespace uuidinfo
