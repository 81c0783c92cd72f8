/**
 * @file error_chain.cpp
 * @brief Nested exception chain helpers.
 *
 * @copyright Copyright (c) 2024 uuidinfo Contributors
 * @license MIT License
 */

#include "uuidinfo/utils/error_chain.hpp"
#include "uuidinfo/utils/string_utils.hpp"

namespace uuidinfo {
namespace utils {

namespace {

void collect(const std::exception& e, std::vector<std::string>& out) {
    out.emplace_back(e.what());
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& cause) {
        collect(cause, out);
    } catch (...) {
        out.emplace_back("unknown error");
    }
}

}  // namespace

std::vector<std::string> exceptionChain(const std::exception& e) {
    std::vector<std::string> chain;
    collect(e, chain);
    return chain;
}

std::string describeException(const std::exception& e) {
    return join(exceptionChain(e), ": ");
}

}  // namespace utils
}  // namespace uuidinfo
