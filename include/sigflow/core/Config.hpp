#pragma once

/**
 * @file Config.hpp
 * @brief Build configuration and debug macros for SigFlow
 *
 * Provides compile-time configuration for debug vs release builds:
 * - SIGFLOW_DEBUG: Defined in Debug builds via CMake
 * - SIGFLOW_ASSERT: Internal invariant checks (throws in debug, no-op in release)
 */

#include <stdexcept>
#include <string>

// =============================================================================
// Debug Assertion Macros
// =============================================================================

#ifdef SIGFLOW_DEBUG

/**
 * @brief Assert a condition in debug builds, throw if false
 * @param cond Condition to check
 * @param msg Error message if condition fails
 *
 * In release builds, this macro compiles to nothing.
 */
#define SIGFLOW_ASSERT(cond, msg)                                                                  \
    do {                                                                                           \
        if (!(cond)) {                                                                             \
            throw std::runtime_error(std::string("SIGFLOW_ASSERT failed: ") + (msg));              \
        }                                                                                          \
    } while (0)

#else // Release builds

#define SIGFLOW_ASSERT(cond, msg) ((void)0)

#endif // SIGFLOW_DEBUG
