/**
 * @file export.hpp
 * @brief Symbol visibility macros for uuidkit_core shared library.
 *
 * This header provides the UUIDKIT_CORE_API macro for cross-platform
 * shared library symbol export/import.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(UUIDKIT_CORE_STATIC)
        #define UUIDKIT_CORE_API
    #elif defined(UUIDKIT_CORE_BUILD)
        // Building the library - export symbols
        #define UUIDKIT_CORE_API __declspec(dllexport)
    #else
        // Using the library - import symbols
        #define UUIDKIT_CORE_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(UUIDKIT_CORE_BUILD)
        #define UUIDKIT_CORE_API __attribute__((visibility("default")))
    #else
        #define UUIDKIT_CORE_API
    #endif
#else
    #define UUIDKIT_CORE_API
#endif
