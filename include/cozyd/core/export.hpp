/**
 * @file export.hpp
 * @brief Symbol visibility macros for the cozyd_core library.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(COZYD_CORE_SHARED) && defined(COZYD_CORE_BUILD)
        #define COZYD_CORE_API __declspec(dllexport)
    #elif defined(COZYD_CORE_SHARED)
        #define COZYD_CORE_API __declspec(dllimport)
    #else
        #define COZYD_CORE_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(COZYD_CORE_BUILD)
        #define COZYD_CORE_API __attribute__((visibility("default")))
    #else
        #define COZYD_CORE_API
    #endif
#else
    #define COZYD_CORE_API
#endif
