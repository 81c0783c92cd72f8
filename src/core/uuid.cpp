/**
 * @file uuid.cpp
 * @brief UUID parsing and field extraction.
 *
 * @copyright Copyright (c) 2024 uuidinfo Contributors
 * @license MIT License
 */

#include "uuidinfo/core/uuid.hpp"
#include "uuidinfo/core/errors.hpp"
#include "uuidinfo/utils/hex.hpp"
#include "uuidinfo/utils/string_utils.hpp"

#include <algorithm>
#include <exception>
#include <vector>

namespace uuidinfo {
namespace core {

namespace {

const char kUrnPrefix[] = "urn:uuid:";

// End offsets of the five dash-separated groups (4-2-2-2-6 bytes).
constexpr size_t kGroupEnds[] = {
    Uuid::kTimeMidIndex, Uuid::kVersionIndex, Uuid::kVariantIndex,
    Uuid::kNodeIndex, Uuid::kLength
};

}  // namespace

const char* variantName(Variant variant) {
    switch (variant) {
        case Variant::NCS:       return "Variant-0 (NCS)";
        case Variant::RFC4122:   return "Variant-1 (RFC4122)";
        case Variant::Microsoft: return "Variant-2 (Microsoft)";
        default:                 return "FutureVariants";
    }
}

Variant classifyVariant(uint8_t byte) {
    if ((byte & 0x80) == 0) {
        return Variant::NCS;
    }
    if ((byte & 0xc0) == 0x80) {
        return Variant::RFC4122;
    }
    if ((byte & 0xe0) == 0xc0) {
        return Variant::Microsoft;
    }
    return Variant::Future;
}

uint8_t maskVariantBits(uint8_t byte) {
    if ((byte & 0x80) == 0) {
        return byte & 0x7f;
    }
    if ((byte & 0xc0) == 0x80) {
        return byte & 0x3f;
    }
    return byte & 0x1f;
}

Uuid Uuid::parse(const std::string& text) {
    std::string s = utils::remove_all(text, '-');

    if (!s.empty() && s[0] == '{') {
        if (s.size() < 2 || !utils::ends_with(s, "}")) {
            throw DecodeError("unable to decode UUID string \"" + text +
                              "\": missing closing brace", text);
        }
        s = s.substr(1, s.size() - 2);
    } else if (utils::starts_with(s, kUrnPrefix)) {
        s = s.substr(sizeof(kUrnPrefix) - 1);
    }

    std::vector<uint8_t> decoded;
    try {
        decoded = utils::hexDecode(s);
    } catch (const utils::HexError&) {
        std::throw_with_nested(
            DecodeError("unable to decode UUID string \"" + text + "\"", text));
    }

    if (decoded.size() != kLength) {
        throw LengthError(text, decoded.size(), kLength);
    }

    Bytes bytes;
    std::copy(decoded.begin(), decoded.end(), bytes.begin());
    return Uuid(bytes);
}

std::optional<utils::MacAddress> Uuid::nodeId() const {
    if (version() > 2) {
        return std::nullopt;
    }
    utils::MacAddress::Bytes node;
    std::copy(bytes_.begin() + kNodeIndex, bytes_.end(), node.begin());
    return utils::MacAddress(node);
}

Uuid::Bytes Uuid::payload() const {
    Bytes data = bytes_;
    data[kVersionIndex] &= 0x0f;
    data[kVariantIndex] = maskVariant();
    return data;
}

std::string Uuid::payloadLabel() const {
    switch (version()) {
        case 3:
        case 5:
            return "Hash";
        case 4:
            return "Random";
        default:
            return "";
    }
}

bool Uuid::isNil() const {
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

std::string Uuid::toLowerString() const {
    std::string out;
    out.reserve(kLength * 2 + 4);
    size_t start = 0;
    for (size_t end : kGroupEnds) {
        if (start > 0) {
            out += '-';
        }
        out += utils::hexEncode(bytes_.data() + start, end - start);
        start = end;
    }
    return out;
}

std::string Uuid::toString() const {
    return utils::to_upper(toLowerString());
}

}  // namespace core
}  // namespace uuidinfo
