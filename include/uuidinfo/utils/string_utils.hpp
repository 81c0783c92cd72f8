/**
 * @file string_utils.hpp
 * @brief Small string helpers shared by the parser, formatters and CLI.
 *
 * @copyright Copyright (c) 2024 uuidinfo Contributors
 * @license MIT License
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace uuidinfo {
namespace utils {

/**
 * @brief Convert string to uppercase
 * @param str Input string
 * @return Uppercase version of the string
 */
inline std::string to_upper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

/**
 * @brief Trim whitespace from both ends of a string
 */
inline std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

/**
 * @brief Split string by delimiter, keeping empty fields
 * @param str Input string
 * @param delimiter Character to split on
 * @return Vector of fields; "a::b" yields {"a", "", "b"}
 */
inline std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> fields;
    std::string::size_type start = 0;
    while (true) {
        std::string::size_type pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            fields.push_back(str.substr(start));
            return fields;
        }
        fields.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
}

/**
 * @brief Remove every occurrence of a character
 */
inline std::string remove_all(const std::string& str, char c) {
    std::string result;
    result.reserve(str.size());
    for (char ch : str) {
        if (ch != c) {
            result += ch;
        }
    }
    return result;
}

/**
 * @brief Check if string starts with prefix
 */
inline bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief Check if string ends with suffix
 */
inline bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/**
 * @brief Join strings with delimiter
 * @param parts Vector of strings
 * @param delimiter Delimiter string
 * @return Joined string
 */
inline std::string join(const std::vector<std::string>& parts, const std::string& delimiter = " ") {
    if (parts.empty()) return "";
    std::string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
        result += delimiter + parts[i];
    }
    return result;
}

}  // namespace utils
}  // namespace uuidinfo
