// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for arbor_transfer
 *
 * Central entry point for feature detection and ecosystem integration flags.
 *
 * Feature categories:
 * - ARBOR_HAS_*     : Local feature availability
 * - KCENON_WITH_*   : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <arbor/transfer/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     auto executor = thread_system_executor::create(workers, "uploads");
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define ARBOR_HAS_COMMON_FEATURE_FLAGS 1
#else
#define ARBOR_HAS_COMMON_FEATURE_FLAGS 0
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

// thread_system integration (thread_pool as the host executor)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (requires common_system)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Local feature flags
//==============================================================================

/**
 * @brief POSIX timestamp support
 *
 * Access and modification times are applied with utimensat() where available.
 */
#ifndef ARBOR_HAS_UTIMENSAT
    #if defined(__unix__) || defined(__APPLE__)
        #define ARBOR_HAS_UTIMENSAT 1
    #else
        #define ARBOR_HAS_UTIMENSAT 0
    #endif
#endif
