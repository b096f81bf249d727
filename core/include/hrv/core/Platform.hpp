/**
 * @file Platform.hpp
 * @brief Compile-time compiler detection and branch-prediction macros.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef HRV_CORE_PLATFORM_HPP
    #define HRV_CORE_PLATFORM_HPP

// ---- Compiler ------------------------------------------------------------

    #if defined(__clang__)
        #define HRV_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define HRV_COMPILER_GCC   1
    #elif defined(_MSC_VER)
        #define HRV_COMPILER_MSVC  1
    #else
        #define HRV_COMPILER_UNKNOWN 1
    #endif

// ---- Intrinsics ----------------------------------------------------------

    #if defined(HRV_COMPILER_GCC) || defined(HRV_COMPILER_CLANG)
        #define HRV_LIKELY(x)       __builtin_expect(!!(x), 1)
        #define HRV_UNLIKELY(x)     __builtin_expect(!!(x), 0)
    #else
        #define HRV_LIKELY(x)       (x)
        #define HRV_UNLIKELY(x)     (x)
    #endif

#endif // HRV_CORE_PLATFORM_HPP
