/**
 * @file mac_address.cpp
 * @brief MAC address parsing and formatting.
 *
 * @copyright Copyright (c) 2024 uuidinfo Contributors
 * @license MIT License
 */

#include "uuidinfo/utils/mac_address.hpp"
#include "uuidinfo/utils/hex.hpp"
#include "uuidinfo/utils/string_utils.hpp"

#include <exception>
#include <vector>

namespace uuidinfo {
namespace utils {

namespace {

// Groups of `width` hex digits; the decoded groups must total six bytes.
MacAddress::Bytes decodeGroups(const std::string& text,
                               const std::vector<std::string>& groups,
                               size_t width) {
    MacAddress::Bytes bytes{};
    size_t pos = 0;
    for (const auto& group : groups) {
        if (group.size() != width) {
            throw MacParseError("invalid MAC address group '" + group + "' in '" + text + "'", text);
        }
        std::vector<uint8_t> decoded;
        try {
            decoded = hexDecode(group);
        } catch (const HexError&) {
            std::throw_with_nested(
                MacParseError("failed to parse MAC address '" + text + "'", text));
        }
        for (uint8_t b : decoded) {
            bytes[pos++] = b;
        }
    }
    return bytes;
}

}  // namespace

MacAddress MacAddress::parse(const std::string& text) {
    // 17 chars for colon/dash form, 14 for dotted form
    if (text.size() == 17 && (text[2] == ':' || text[2] == '-')) {
        auto groups = split(text, text[2]);
        if (groups.size() != kLength) {
            throw MacParseError("invalid MAC address '" + text + "'", text);
        }
        return MacAddress(decodeGroups(text, groups, 2));
    }

    if (text.size() == 14 && text[4] == '.') {
        auto groups = split(text, '.');
        if (groups.size() != 3) {
            throw MacParseError("invalid MAC address '" + text + "'", text);
        }
        return MacAddress(decodeGroups(text, groups, 4));
    }

    throw MacParseError("invalid MAC address '" + text + "'", text);
}

std::string MacAddress::toString(const std::string& delimiter, bool upper) const {
    std::string s = hexEncodeJoined(bytes_.data(), bytes_.size(), delimiter);
    return upper ? to_upper(s) : s;
}

std::string formatMac(const std::optional<MacAddress>& mac,
                      const std::string& delimiter,
                      bool upper) {
    if (!mac) {
        return kNullMacAddress;
    }
    return mac->toString(delimiter, upper);
}

}  // namespace utils
}  // namespace uuidinfo
