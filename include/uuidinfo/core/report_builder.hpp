/**
 * @file report_builder.hpp
 * @brief Human-readable description of a decoded UUID.
 *
 * @copyright Copyright (c) 2024 uuidinfo Contributors
 * @license MIT License
 */

#pragma once

#include "uuidinfo/core/export.hpp"
#include "uuidinfo/core/uuid.hpp"
#include "uuidinfo/core/version_info.hpp"

#include <string>
#include <utility>
#include <vector>

namespace uuidinfo {
namespace core {

/**
 * @struct ReportOptions
 * @brief Decoding and formatting choices for a report.
 */
struct ReportOptions {
    DecodeOptions decode;
    std::string mac_delimiter = ":";
    bool mac_uppercase = false;
};

/**
 * @struct Report
 * @brief Ordered (label, value) description of one UUID.
 */
struct Report {
    std::string uuid;  ///< Canonical uppercase form
    std::vector<std::pair<std::string, std::string>> fields;

    /// Value of the first field with this label, empty if none.
    std::string field(const std::string& label) const;
};

/**
 * @brief Describe a UUID.
 *
 * Fields are, in order: Variant, Version, then for versions 1 and 2
 * MAC Address, Timestamp, (Local ID, Domain for version 2) and
 * Clock Sequence; for versions 3-5 "Hash Data (16)" or
 * "Random Data (16)" as colon-joined hex.
 */
UUIDINFO_CORE_API Report buildReport(const Uuid& uuid,
                                     const ReportOptions& options = ReportOptions());

/**
 * @brief Multi-line text form:
 * @code
 * UUID: 8BE4DF61-93CA-11D2-AA0D-00E098032B8C
 *  * Variant: Variant-1 (RFC4122)
 *  * Version: Version-1
 *  ...
 * @endcode
 */
UUIDINFO_CORE_API std::string renderText(const Report& report);

}  // namespace core
}  // namespace uuidinfo
