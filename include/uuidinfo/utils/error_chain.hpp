/**
 * @file error_chain.hpp
 * @brief Flattening of nested exception chains for diagnostics.
 *
 * Errors in uuidinfo keep their low-level cause by throwing the
 * contextual error with std::throw_with_nested. These helpers turn such
 * a chain back into readable text.
 *
 * @copyright Copyright (c) 2024 uuidinfo Contributors
 * @license MIT License
 */

#pragma once

#include "uuidinfo/utils/export.hpp"

#include <exception>
#include <string>
#include <vector>

namespace uuidinfo {
namespace utils {

/**
 * @brief Messages of an exception and all of its nested causes,
 * outermost first.
 */
UUIDINFO_UTILS_API std::vector<std::string> exceptionChain(const std::exception& e);

/**
 * @brief The exception chain joined as "outer: inner: innermost".
 */
UUIDINFO_UTILS_API std::string describeException(const std::exception& e);

}  // namespace utils
}  // namespace uuidinfo
