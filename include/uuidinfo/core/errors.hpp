/**
 * @file errors.hpp
 * @brief Errors reported when turning text into a UUID.
 *
 * Low-level causes (e.g. utils::HexError) are kept as nested exceptions;
 * use utils::describeException() for the full chain.
 *
 * @copyright Copyright (c) 2024 uuidinfo Contributors
 * @license MIT License
 */

#pragma once

#include "uuidinfo/core/export.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace uuidinfo {
namespace core {

/**
 * @class ParseError
 * @brief Base class of all UUID text parse failures.
 */
class UUIDINFO_CORE_API ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, const std::string& input)
        : std::runtime_error(message), input_(input) {}

    /// The text exactly as passed to Uuid::parse().
    const std::string& input() const { return input_; }

private:
    std::string input_;
};

/**
 * @class DecodeError
 * @brief The text is not hexadecimal once delimiters are stripped.
 */
class UUIDINFO_CORE_API DecodeError : public ParseError {
public:
    using ParseError::ParseError;
};

/**
 * @class LengthError
 * @brief The text decoded to a byte count other than 16.
 */
class UUIDINFO_CORE_API LengthError : public ParseError {
public:
    LengthError(const std::string& input, size_t actual, size_t expected)
        : ParseError(makeMessage(input, actual, expected), input),
          actual_(actual), expected_(expected) {}

    size_t actual() const { return actual_; }
    size_t expected() const { return expected_; }

private:
    static std::string makeMessage(const std::string& input, size_t actual, size_t expected) {
        return "failed to decode UUID string \"" + input + "\": wrong length of bytes (" +
               std::to_string(actual) + "), expected " + std::to_string(expected);
    }

    size_t actual_;
    size_t expected_;
};

}  // namespace core
}  // namespace uuidinfo
