/**
 * @file mac_address.hpp
 * @brief 48-bit hardware (MAC) address value type.
 *
 * @copyright Copyright (c) 2024 uuidinfo Contributors
 * @license MIT License
 */

#pragma once

#include "uuidinfo/utils/export.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace uuidinfo {
namespace utils {

/**
 * @class MacParseError
 * @brief Raised for a malformed hardware address string.
 */
class UUIDINFO_UTILS_API MacParseError : public std::runtime_error {
public:
    MacParseError(const std::string& message, const std::string& input)
        : std::runtime_error(message), input_(input) {}

    const std::string& input() const { return input_; }

private:
    std::string input_;
};

/**
 * @class MacAddress
 * @brief Six raw bytes of an IEEE 802 MAC-48 address.
 *
 * Usage:
 * @code
 * MacAddress mac = MacAddress::parse("00-E0-98-03-2B-8C");
 * mac.toString();          // "00:e0:98:03:2b:8c"
 * mac.toString("-", true); // "00-E0-98-03-2B-8C"
 * @endcode
 */
class UUIDINFO_UTILS_API MacAddress {
public:
    static constexpr size_t kLength = 6;
    using Bytes = std::array<uint8_t, kLength>;

    MacAddress() : bytes_{} {}
    explicit MacAddress(const Bytes& bytes) : bytes_(bytes) {}

    /**
     * @brief Parse "xx:xx:xx:xx:xx:xx", "xx-xx-xx-xx-xx-xx" or
     * "xxxx.xxxx.xxxx".
     * @throws MacParseError; a bad hex group nests the HexError cause.
     */
    static MacAddress parse(const std::string& text);

    const Bytes& bytes() const { return bytes_; }

    /**
     * @brief Render as hex pairs joined by a delimiter.
     * @param delimiter Separator placed between bytes
     * @param upper Use uppercase hex digits
     */
    std::string toString(const std::string& delimiter = ":", bool upper = false) const;

    bool operator==(const MacAddress& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const MacAddress& other) const { return bytes_ != other.bytes_; }

private:
    Bytes bytes_;
};

/// Text used for an absent address.
constexpr const char* kNullMacAddress = "<Null_MAC_Address>";

/**
 * @brief Format an optional address; absent yields kNullMacAddress.
 */
UUIDINFO_UTILS_API std::string formatMac(const std::optional<MacAddress>& mac,
                                         const std::string& delimiter = ":",
                                         bool upper = false);

}  // namespace utils
}  // namespace uuidinfo
