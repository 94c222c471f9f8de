// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for garage_transfer
 *
 * Central entry point for feature detection and ecosystem integration
 * flags. Include this header to get the GARAGE_TRANSFER_HAS_* and
 * KCENON_WITH_* macros.
 *
 * Feature categories:
 * - GARAGE_TRANSFER_HAS_* : Local feature availability
 * - KCENON_WITH_*         : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <garage/transfer/config/feature_flags.h>
 *
 * #if KCENON_WITH_NETWORK_SYSTEM
 *     auto response = client->get(url, query, headers);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define GARAGE_TRANSFER_HAS_COMMON_FEATURE_FLAGS 1
#else
#define GARAGE_TRANSFER_HAS_COMMON_FEATURE_FLAGS 0
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

// thread_system integration (worker pool for the task runner)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

// network_system integration (HTTP client for the S3 gateway)
#ifndef KCENON_WITH_NETWORK_SYSTEM
    #if defined(BUILD_WITH_NETWORK_SYSTEM)
        #define KCENON_WITH_NETWORK_SYSTEM 1
    #else
        #define KCENON_WITH_NETWORK_SYSTEM 0
    #endif
#endif

//==============================================================================
// Garage Transfer Feature Flags
//==============================================================================

/**
 * @brief Remote gateway support
 *
 * The S3 gateway needs network_system for HTTP. Without it the gateway
 * still builds, but every request fails with backend_unavailable.
 */
#ifndef GARAGE_TRANSFER_HAS_HTTP
    #if KCENON_WITH_NETWORK_SYSTEM
        #define GARAGE_TRANSFER_HAS_HTTP 1
    #else
        #define GARAGE_TRANSFER_HAS_HTTP 0
    #endif
#endif

/**
 * @brief Unified flag for logger_system usage
 *
 * logger_system depends on common_system, so both must be present.
 */
#ifndef GARAGE_TRANSFER_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define GARAGE_TRANSFER_USE_LOGGER_SYSTEM 1
    #else
        #define GARAGE_TRANSFER_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef GARAGE_TRANSFER_PRINT_FEATURE_SUMMARY

#pragma message("=== Garage Transfer Feature Summary ===")

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available (std::async pool)")
#endif

#if KCENON_WITH_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available (stderr logging)")
#endif

#if KCENON_WITH_NETWORK_SYSTEM
    #pragma message("  network_system: Available")
#else
    #pragma message("  network_system: Not Available (no HTTP)")
#endif

#pragma message("========================================")

#endif  // GARAGE_TRANSFER_PRINT_FEATURE_SUMMARY
