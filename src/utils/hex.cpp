/**
 * @file hex.cpp
 * @brief Hexadecimal codec implementation.
 *
 * @copyright Copyright (c) 2024 uuidinfo Contributors
 * @license MIT License
 */

#include "uuidinfo/utils/hex.hpp"

#include <iomanip>
#include <sstream>

namespace uuidinfo {
namespace utils {

namespace {

const char kHexDigits[] = "0123456789abcdef";

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

HexError invalidByte(const std::string& text, size_t offset) {
    std::ostringstream oss;
    oss << "invalid hex byte '" << text[offset] << "' (0x"
        << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(static_cast<unsigned char>(text[offset]))
        << std::dec << ") at offset " << offset;
    return HexError(HexError::Kind::InvalidByte, oss.str(), offset, text[offset]);
}

}  // namespace

std::vector<uint8_t> hexDecode(const std::string& text) {
    std::vector<uint8_t> out;
    out.reserve(text.size() / 2);

    size_t i = 0;
    for (; i + 1 < text.size(); i += 2) {
        int hi = hexValue(text[i]);
        if (hi < 0) {
            throw invalidByte(text, i);
        }
        int lo = hexValue(text[i + 1]);
        if (lo < 0) {
            throw invalidByte(text, i + 1);
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }

    if (i < text.size()) {
        if (hexValue(text[i]) < 0) {
            throw invalidByte(text, i);
        }
        throw HexError(HexError::Kind::OddLength,
                       "odd length hex string (" + std::to_string(text.size()) + " digits)");
    }

    return out;
}

std::string hexEncode(const uint8_t* data, size_t length) {
    std::string out;
    out.reserve(length * 2);
    for (size_t i = 0; i < length; ++i) {
        out += kHexDigits[data[i] >> 4];
        out += kHexDigits[data[i] & 0x0f];
    }
    return out;
}

std::string hexEncodeJoined(const uint8_t* data, size_t length, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < length; ++i) {
        if (i > 0) {
            out += separator;
        }
        out += kHexDigits[data[i] >> 4];
        out += kHexDigits[data[i] & 0x0f];
    }
    return out;
}

}  // namespace utils
}  // namespace uuidinfo
