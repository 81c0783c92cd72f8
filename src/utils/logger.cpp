/**
 * @file logger.cpp
 * @brief Logger implementation (header-only; this provides linkage).
 *
 * @copyright Copyright (c) 2024 uuidinfo Contributors
 * @license MIT License
 */

#include "uuidinfo/utils/logger.hpp"

namespace uuidinfo {
namespace utils {

// The Logger singleton lives in the header via a static local; this
// translation unit anchors it in uuidinfo_utils.

}  // namespace utils
}  // namespace uuidinfo
