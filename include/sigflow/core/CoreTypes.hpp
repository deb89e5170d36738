#pragma once

/**
 * @file CoreTypes.hpp
 * @brief Core type definitions for SigFlow
 *
 * Step bookkeeping shared by blocks and the runtime, builder state,
 * and version information.
 */

#include <cstdint>
#include <string>

namespace sigflow {

// =============================================================================
// Step Bookkeeping
// =============================================================================

/**
 * @brief Per-step information handed to every block
 *
 * `k` starts at 1 on the first step. `t` is the simulated time at the
 * beginning of the step and advances by `dt` after every step.
 */
struct StepInfo {
    std::uint64_t k = 1; ///< Step counter (1-based)
    double t = 0.0;      ///< Simulated time [s]
    double dt = 0.0;     ///< Fixed time increment [s]

    /// Initial step info for a run with the given time increment
    [[nodiscard]] static StepInfo Initial(double dt) { return StepInfo{1, 0.0, dt}; }

    /// Advance to the next step
    void Advance() {
        ++k;
        t += dt;
    }
};

/**
 * @brief Outcome of a block step or a runtime step
 */
enum class StepResult : uint8_t {
    Continue, ///< Keep stepping
    Stop      ///< A block requested termination (advisory)
};

/// Human-readable name for a StepResult
inline const char *ToString(StepResult result) {
    switch (result) {
    case StepResult::Continue:
        return "Continue";
    case StepResult::Stop:
        return "Stop";
    }
    return "Unknown";
}

// =============================================================================
// Builder Lifecycle
// =============================================================================

/**
 * @brief Builder lifecycle states (one-way transition)
 */
enum class BuilderState : uint8_t {
    Open, ///< Accepting blocks
    Built ///< Runtime produced, no further changes
};

// =============================================================================
// Version Information
// =============================================================================

// Single source of truth for version numbers
#define SIGFLOW_VERSION_MAJOR 0
#define SIGFLOW_VERSION_MINOR 4
#define SIGFLOW_VERSION_PATCH 0

// Stringify helper
#define SIGFLOW_STRINGIFY(x) #x
#define SIGFLOW_VERSION_STR(major, minor, patch)                                                   \
    SIGFLOW_STRINGIFY(major) "." SIGFLOW_STRINGIFY(minor) "." SIGFLOW_STRINGIFY(patch)

/// Major version number
constexpr int VersionMajor() { return SIGFLOW_VERSION_MAJOR; }

/// Minor version number
constexpr int VersionMinor() { return SIGFLOW_VERSION_MINOR; }

/// Patch version number
constexpr int VersionPatch() { return SIGFLOW_VERSION_PATCH; }

/// Version string (derived from components)
constexpr const char *Version() {
    return SIGFLOW_VERSION_STR(SIGFLOW_VERSION_MAJOR, SIGFLOW_VERSION_MINOR,
                               SIGFLOW_VERSION_PATCH);
}

// =============================================================================
// Naming Utilities
// =============================================================================

/**
 * @brief Name of the i-th member of a port array (1-based): "u" -> "u1"
 */
inline std::string IndexedPortName(const std::string &base, std::size_t index) {
    return base + std::to_string(index);
}

} // namespace sigflow
