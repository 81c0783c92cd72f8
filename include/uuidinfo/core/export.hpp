/**
 * @file export.hpp
 * @brief Symbol visibility macros for the uuidinfo_core shared library.
 *
 * @copyright Copyright (c) 2024 uuidinfo Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(UUIDINFO_CORE_BUILD)
        #define UUIDINFO_CORE_API __declspec(dllexport)
    #else
        #define UUIDINFO_CORE_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(UUIDINFO_CORE_BUILD)
        #define UUIDINFO_CORE_API __attribute__((visibility("default")))
    #else
        #define UUIDINFO_CORE_API
    #endif
#else
    #define UUIDINFO_CORE_API
#endif
