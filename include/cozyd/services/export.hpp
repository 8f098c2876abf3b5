/**
 * @file export.hpp
 * @brief Symbol visibility macros for the cozyd_services library.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(COZYD_SERVICES_SHARED) && defined(COZYD_SERVICES_BUILD)
        #define COZYD_SERVICES_API __declspec(dllexport)
    #elif defined(COZYD_SERVICES_SHARED)
        #define COZYD_SERVICES_API __declspec(dllimport)
    #else
        #define COZYD_SERVICES_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(COZYD_SERVICES_BUILD)
        #define COZYD_SERVICES_API __attribute__((visibility("default")))
    #else
        #define COZYD_SERVICES_API
    #endif
#else
    #define COZYD_SERVICES_API
#endif
