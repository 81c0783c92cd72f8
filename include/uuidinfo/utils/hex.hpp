/**
 * @file hex.hpp
 * @brief Hexadecimal encoding and decoding of byte buffers.
 *
 * @copyright Copyright (c) 2024 uuidinfo Contributors
 * @license MIT License
 */

#pragma once

#include "uuidinfo/utils/export.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace uuidinfo {
namespace utils {

/**
 * @class HexError
 * @brief Raised when a string is not valid hexadecimal.
 */
class UUIDINFO_UTILS_API HexError : public std::runtime_error {
public:
    enum class Kind {
        InvalidByte,  ///< A character outside [0-9a-fA-F]
        OddLength     ///< Digit count is not a multiple of two
    };

    HexError(Kind kind, const std::string& message, size_t offset = 0, char character = '\0')
        : std::runtime_error(message), kind_(kind), offset_(offset), character_(character) {}

    Kind kind() const { return kind_; }

    /// Offset of the offending character (InvalidByte only).
    size_t offset() const { return offset_; }

    /// The offending character (InvalidByte only).
    char character() const { return character_; }

private:
    Kind kind_;
    size_t offset_;
    char character_;
};

/**
 * @brief Decode a hex string (case-insensitive, no separators).
 *
 * Invalid characters are reported before an odd digit count, so
 * "abc" fails as OddLength while "abz" fails as InvalidByte.
 *
 * @throws HexError
 */
UUIDINFO_UTILS_API std::vector<uint8_t> hexDecode(const std::string& text);

/**
 * @brief Encode bytes as lowercase hex without separators.
 */
UUIDINFO_UTILS_API std::string hexEncode(const uint8_t* data, size_t length);

/**
 * @brief Encode bytes as lowercase hex pairs joined by a separator,
 * e.g. "8b:e4:df".
 */
UUIDINFO_UTILS_API std::string hexEncodeJoined(const uint8_t* data, size_t length,
                                               const std::string& separator);

}  // namespace utils
}  // namespace uuidinfo
