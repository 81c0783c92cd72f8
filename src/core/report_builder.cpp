/**
 * @file report_builder.cpp
 * @brief Report composition.
 *
 * @copyright Copyright (c) 2024 uuidinfo Contributors
 * @license MIT License
 */

#include "uuidinfo/core/report_builder.hpp"
#include "uuidinfo/utils/hex.hpp"
#include "uuidinfo/utils/logger.hpp"
#include "uuidinfo/utils/mac_address.hpp"

#include <sstream>
#include <type_traits>

namespace uuidinfo {
namespace core {

namespace {

std::string dataField(const char* name, const Uuid::Bytes& data) {
    return std::string(name) + " Data (" + std::to_string(data.size()) + ")";
}

std::string dataValue(const Uuid::Bytes& data) {
    return utils::hexEncodeJoined(data.data(), data.size(), ":");
}

}  // namespace

std::string Report::field(const std::string& label) const {
    for (const auto& [key, value] : fields) {
        if (key == label) {
            return value;
        }
    }
    return "";
}

Report buildReport(const Uuid& uuid, const ReportOptions& options) {
    Report report;
    report.uuid = uuid.toString();

    const VersionInfo info = decodeVersion(uuid, options.decode);

    report.fields.emplace_back("Variant", variantName(uuid.variant()));
    report.fields.emplace_back("Version", versionLabel(versionNumber(info)));

    const std::string mac = utils::formatMac(uuid.nodeId(), options.mac_delimiter,
                                             options.mac_uppercase);

    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, TimeBasedVersion>) {
            report.fields.emplace_back("MAC Address", mac);
            report.fields.emplace_back("Timestamp", formatUtc(v.timestamp));
            report.fields.emplace_back("Clock Sequence", std::to_string(v.clock_sequence));
        } else if constexpr (std::is_same_v<T, DceSecurityVersion>) {
            report.fields.emplace_back("MAC Address", mac);
            report.fields.emplace_back("Timestamp", formatUtc(v.timestamp));
            report.fields.emplace_back("Local ID", std::to_string(v.local_id));
            report.fields.emplace_back("Domain", std::to_string(v.domain));
            report.fields.emplace_back("Clock Sequence", std::to_string(v.clock_sequence));
        } else if constexpr (std::is_same_v<T, NameBasedMd5Version> ||
                             std::is_same_v<T, NameBasedSha1Version>) {
            report.fields.emplace_back(dataField("Hash", v.hash), dataValue(v.hash));
        } else if constexpr (std::is_same_v<T, RandomVersion>) {
            report.fields.emplace_back(dataField("Random", v.random), dataValue(v.random));
        }
    }, info);

    LOG_DEBUG("Report", "Built report for {} with {} fields", report.uuid, report.fields.size());
    return report;
}

std::string renderText(const Report& report) {
    std::ostringstream oss;
    oss << "UUID: " << report.uuid << "\n";
    for (const auto& [label, value] : report.fields) {
        oss << " * " << label << ": " << value << "\n";
    }
    return oss.str();
}

}  // namespace core
}  // namespace uuidinfo
