// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Feature flags for blob_transfer
 *
 * Maps the BUILD_WITH_* compile definitions set by CMake to the KCENON_WITH_*
 * integration macros used throughout the library.
 *
 * Usage:
 * @code
 * #include <kcenon/blob_transfer/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     auto pool = adapters::thread_system_transfer_adapter::create_default();
 * #endif
 * @endcode
 */

#pragma once

#if defined(BUILD_WITH_COMMON_SYSTEM)
#include <kcenon/common/config/feature_flags.h>
#endif

//==============================================================================
// Blob Transfer Feature Flags
//==============================================================================

/**
 * @brief SHA-256 verification of downloaded blobs (OpenSSL)
 *
 * Always available: OpenSSL is a required dependency.
 */
#ifndef BLOB_TRANSFER_HAS_SHA256
    #define BLOB_TRANSFER_HAS_SHA256 1
#endif

/**
 * @brief Interface polling reachability monitor
 *
 * Requires getifaddrs(); unavailable on other platforms, where only the
 * manual monitor is provided.
 */
#ifndef BLOB_TRANSFER_HAS_INTERFACE_MONITOR
    #if defined(__linux__) || defined(__APPLE__)
        #define BLOB_TRANSFER_HAS_INTERFACE_MONITOR 1
    #else
        #define BLOB_TRANSFER_HAS_INTERFACE_MONITOR 0
    #endif
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

// common_system integration
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (thread_pool for operation execution)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging backend)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

/**
 * @brief logger_system backs transfer_logger only together with common_system
 */
#ifndef BLOB_TRANSFER_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define BLOB_TRANSFER_USE_LOGGER_SYSTEM 1
    #else
        #define BLOB_TRANSFER_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef BLOB_TRANSFER_PRINT_FEATURE_SUMMARY

#pragma message("=== Blob Transfer Feature Summary ===")

#if BLOB_TRANSFER_HAS_INTERFACE_MONITOR
    #pragma message("  Interface reachability monitor: Enabled")
#else
    #pragma message("  Interface reachability monitor: Disabled")
#endif

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available (standalone worker pool)")
#endif

#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available (stderr output)")
#endif

#pragma message("=====================================")

#endif  // BLOB_TRANSFER_PRINT_FEATURE_SUMMARY
