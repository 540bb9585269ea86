// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for streamup
 *
 * Central entry point for the kcenon ecosystem integration flags used by
 * streamup. Each KCENON_WITH_* macro is 1 when the corresponding system was
 * enabled at build time (BUILD_WITH_* compile definition) and 0 otherwise.
 *
 * Usage:
 * @code
 * #include <kcenon/streamup/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     auto pool = std::make_shared<kcenon::thread::thread_pool>("uploads");
 * #endif
 * @endcode
 *
 * @see common_system/config/feature_flags.h for upstream feature detection
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if defined(BUILD_WITH_COMMON_SYSTEM)
#include <kcenon/common/config/feature_flags.h>
#define STREAMUP_HAS_COMMON_FEATURE_FLAGS 1
#else
#define STREAMUP_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

// common_system integration (result types shared with thread_system jobs)
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (thread_pool for pipeline workers)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (asynchronous log backend)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

// network_system integration (HTTP transport for the S3 backend)
#ifndef KCENON_WITH_NETWORK_SYSTEM
    #if defined(BUILD_WITH_NETWORK_SYSTEM)
        #define KCENON_WITH_NETWORK_SYSTEM 1
    #else
        #define KCENON_WITH_NETWORK_SYSTEM 0
    #endif
#endif

//==============================================================================
// Convenience Macros
//==============================================================================

/**
 * @brief Check if any kcenon ecosystem integration is enabled
 */
#define STREAMUP_HAS_ECOSYSTEM_INTEGRATION \
    (KCENON_WITH_THREAD_SYSTEM || KCENON_WITH_LOGGER_SYSTEM || \
     KCENON_WITH_NETWORK_SYSTEM)
