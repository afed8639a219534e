#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - CPNVISION_BUILD_SHARED: when building CpnVision as shared library
 *   - CPNVISION_USE_SHARED: when using CpnVision as shared library
 *   - CPNVISION_STATIC: when building/using as static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(CPNVISION_BUILD_SHARED)
        #define CPNVISION_API __declspec(dllexport)
    #elif defined(CPNVISION_USE_SHARED)
        #define CPNVISION_API __declspec(dllimport)
    #else
        #define CPNVISION_API
    #endif
    #define CPNVISION_CALL __cdecl
#else
    #if defined(CPNVISION_BUILD_SHARED)
        #define CPNVISION_API __attribute__((visibility("default")))
    #else
        #define CPNVISION_API
    #endif
    #define CPNVISION_CALL
#endif
