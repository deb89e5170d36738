#pragma once

/**
 * @file Ode.hpp
 * @brief Fixed-step ODE solvers for plant blocks
 *
 * One solver call advances `y' = f(t, y)` by a single step `dt`. Plant blocks
 * call it from Step() with the system's time increment.
 */

#include <Eigen/Core>

#include <concepts>
#include <string>

namespace sigflow {

/// Fixed-size state vector
template <int D> using StateVector = Eigen::Matrix<double, D, 1>;

/**
 * @brief Callable usable as a right-hand side: f(t, y) -> dy/dt
 */
template <typename F, int D>
concept OdeFunction = requires(F f, double t, const StateVector<D> &y) {
    { f(t, y) } -> std::convertible_to<StateVector<D>>;
};

// =============================================================================
// Forward Euler (1st Order)
// =============================================================================

/**
 * @brief Forward Euler step
 *
 * ```
 * y_{n+1} = y + dt·f(t, y)
 * ```
 */
struct ForwardEuler {
    [[nodiscard]] static std::string Name() { return "Euler"; }
    [[nodiscard]] static constexpr int Order() { return 1; }

    template <int D, OdeFunction<D> F>
    [[nodiscard]] static StateVector<D> Solve(F &&f, double t0, double dt,
                                              const StateVector<D> &y0) {
        return y0 + dt * StateVector<D>(f(t0, y0));
    }
};

// =============================================================================
// Classic RK4 (4th Order)
// =============================================================================

/**
 * @brief Classic 4th-order Runge-Kutta step
 *
 * **Butcher Tableau:**
 * ```
 * k₁ = f(t, y)
 * k₂ = f(t + dt/2, y + dt/2·k₁)
 * k₃ = f(t + dt/2, y + dt/2·k₂)
 * k₄ = f(t + dt, y + dt·k₃)
 * y_{n+1} = y + (dt/6)(k₁ + 2k₂ + 2k₃ + k₄)
 * ```
 */
struct RungeKutta4 {
    [[nodiscard]] static std::string Name() { return "RK4"; }
    [[nodiscard]] static constexpr int Order() { return 4; }

    template <int D, OdeFunction<D> F>
    [[nodiscard]] static StateVector<D> Solve(F &&f, double t0, double dt,
                                              const StateVector<D> &y0) {
        const double half = 0.5 * dt;
        const StateVector<D> k1 = f(t0, y0);
        const StateVector<D> k2 = f(t0 + half, StateVector<D>(y0 + half * k1));
        const StateVector<D> k3 = f(t0 + half, StateVector<D>(y0 + half * k2));
        const StateVector<D> k4 = f(t0 + dt, StateVector<D>(y0 + dt * k3));
        return y0 + (dt / 6.0) * (k1 + 2.0 * k2 + 2.0 * k3 + k4);
    }
};

} // namespace sigflow
