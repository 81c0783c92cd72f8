/**
 * @file uuid.hpp
 * @brief Validated 128-bit UUID and its field accessors.
 *
 * A Uuid always holds exactly 16 bytes, so every accessor below is safe
 * on any instance. Derived values are computed on demand; the buffer is
 * never modified after construction.
 *
 * Layout (RFC 4122, big-endian field order):
 *
 * | Bytes   | Field                                |
 * |---------|--------------------------------------|
 * | [0,4)   | time_low                             |
 * | [4,6)   | time_mid                             |
 * | [6,8)   | time_hi_and_version (version = 6.hi) |
 * | 8       | clock_seq_hi_and_variant             |
 * | 9       | clock_seq_low                        |
 * | [10,16) | node                                 |
 *
 * @copyright Copyright (c) 2024 uuidinfo Contributors
 * @license MIT License
 */

#pragma once

#include "uuidinfo/core/export.hpp"
#include "uuidinfo/utils/mac_address.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace uuidinfo {
namespace core {

/**
 * @enum Variant
 * @brief Layout family, taken from the high bits of byte 8.
 */
enum class Variant {
    NCS,        ///< 0xx, reserved for NCS backward compatibility
    RFC4122,    ///< 10x
    Microsoft,  ///< 110, reserved for Microsoft backward compatibility
    Future      ///< 111, reserved for future definition
};

/**
 * @brief Display name, e.g. "Variant-1 (RFC4122)".
 */
UUIDINFO_CORE_API const char* variantName(Variant variant);

/**
 * @brief Classify a clock_seq_hi_and_variant byte.
 */
UUIDINFO_CORE_API Variant classifyVariant(uint8_t byte);

/**
 * @brief Clear the variant indicator bits of a clock_seq_hi_and_variant byte.
 *
 * One high bit is cleared for 0xx, two for 10x and three otherwise.
 */
UUIDINFO_CORE_API uint8_t maskVariantBits(uint8_t byte);

/**
 * @class Uuid
 * @brief Immutable 16-byte UUID.
 *
 * Usage:
 * @code
 * Uuid id = Uuid::parse("{8be4df61-93ca-11d2-aa0d-00e098032b8c}");
 * id.version();   // 1
 * id.variant();   // Variant::RFC4122
 * id.toString();  // "8BE4DF61-93CA-11D2-AA0D-00E098032B8C"
 * @endcode
 */
class UUIDINFO_CORE_API Uuid {
public:
    static constexpr size_t kLength = 16;
    static constexpr size_t kTimeMidIndex = 4;
    static constexpr size_t kVersionIndex = 6;
    static constexpr size_t kVariantIndex = 8;
    static constexpr size_t kNodeIndex = 10;

    using Bytes = std::array<uint8_t, kLength>;

    /**
     * @brief Parse the textual forms of a UUID.
     *
     * Dashes are ignored anywhere. The remaining text may be wrapped in
     * braces, prefixed with "urn:uuid:" or bare; hex digits are
     * case-insensitive.
     *
     * @throws DecodeError if the text is not hexadecimal (the HexError
     *         cause is nested), LengthError if it does not decode to
     *         exactly 16 bytes.
     */
    static Uuid parse(const std::string& text);

    /// The nil UUID.
    Uuid() : bytes_{} {}

    explicit Uuid(const Bytes& bytes) : bytes_(bytes) {}

    const Bytes& bytes() const { return bytes_; }

    uint8_t operator[](size_t index) const { return bytes_[index]; }

    /**
     * @brief High nibble of byte 6, 0-15. 0 denotes the null UUID.
     */
    int version() const { return bytes_[kVersionIndex] >> 4; }

    Variant variant() const { return classifyVariant(bytes_[kVariantIndex]); }

    /**
     * @brief Byte 8 with its variant bits cleared.
     */
    uint8_t maskVariant() const { return maskVariantBits(bytes_[kVariantIndex]); }

    /**
     * @brief Node identifier for versions 0-2, absent otherwise.
     */
    std::optional<utils::MacAddress> nodeId() const;

    /**
     * @brief Copy of the bytes with version nibble and variant bits cleared.
     *
     * For versions 3-5 this is the hash or random data proper.
     */
    Bytes payload() const;

    /**
     * @brief "Random" for version 4, "Hash" for 3 and 5, empty otherwise.
     */
    std::string payloadLabel() const;

    bool isNil() const;

    /**
     * @brief Canonical uppercase 8-4-4-4-12 form.
     */
    std::string toString() const;

    /**
     * @brief Lowercase 8-4-4-4-12 form.
     */
    std::string toLowerString() const;

    bool operator==(const Uuid& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Uuid& other) const { return bytes_ != other.bytes_; }

private:
    Bytes bytes_;
};

}  // namespace core
}  // namespace uuidinfo
