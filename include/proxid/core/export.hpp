/**
 * @file export.hpp
 * @brief Symbol visibility macros for the proxid_core library.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(PROXID_CORE_BUILD)
        #define PROXID_CORE_API __declspec(dllexport)
    #else
        #define PROXID_CORE_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(PROXID_CORE_BUILD)
        #define PROXID_CORE_API __attribute__((visibility("default")))
    #else
        #define PROXID_CORE_API
    #endif
#else
    #define PROXID_CORE_API
#endif
