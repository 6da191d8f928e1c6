/**
 * @file export.hpp
 * @brief Symbol visibility macros for uuidkit_utils shared library.
 *
 * This header provides the UUIDKIT_UTILS_API macro for cross-platform
 * shared library symbol export/import.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(UUIDKIT_UTILS_STATIC)
        #define UUIDKIT_UTILS_API
    #elif defined(UUIDKIT_UTILS_BUILD)
        // Building the library - export symbols
        #define UUIDKIT_UTILS_API __declspec(dllexport)
    #else
        // Using the library - import symbols
        #define UUIDKIT_UTILS_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(UUIDKIT_UTILS_BUILD)
        #define UUIDKIT_UTILS_API __attribute__((visibility("default")))
    #else
        #define UUIDKIT_UTILS_API
    #endif
#else
    #define UUIDKIT_UTILS_API
#endif
