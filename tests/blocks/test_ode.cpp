/**
 * @file test_ode.cpp
 * @brief Tests for the fixed-step ODE solvers
 */

#include <gtest/gtest.h>
#include <sigflow/numeric/Ode.hpp>

#include <cmath>

namespace sigflow {
namespace {

// Exponential decay: dy/dt = -y, y(0) = 1 => y(t) = e^(-t)
StateVector<1> Decay(double /*t*/, const StateVector<1> &y) { return -y; }

// Harmonic oscillator with ω = 2: state [x, v]
StateVector<2> Oscillator(double /*t*/, const StateVector<2> &y) {
    StateVector<2> dy;
    dy << y(1), -4.0 * y(0);
    return dy;
}

TEST(ForwardEulerTest, SingleStep) {
    StateVector<1> y0;
    y0 << 1.0;
    auto y1 = ForwardEuler::Solve<1>(Decay, 0.0, 0.1, y0);
    EXPECT_DOUBLE_EQ(y1(0), 0.9);
}

TEST(ForwardEulerTest, Metadata) {
    EXPECT_EQ(ForwardEuler::Name(), "Euler");
    EXPECT_EQ(ForwardEuler::Order(), 1);
}

TEST(RungeKutta4Test, ExponentialDecay) {
    StateVector<1> y;
    y << 1.0;
    double t = 0.0;
    const double dt = 0.1;
    for (int i = 0; i < 10; ++i) {
        y = RungeKutta4::Solve<1>(Decay, t, dt, y);
        t += dt;
    }
    EXPECT_NEAR(y(0), std::exp(-1.0), 1e-6);
}

TEST(RungeKutta4Test, ExactForCubicIntegrand) {
    // y' = t², y(0) = 0 => y(1) = 1/3; RK4 is exact for polynomials up to degree 3
    auto f = [](double t, const StateVector<1> & /*y*/) {
        StateVector<1> dy;
        dy << t * t;
        return dy;
    };
    StateVector<1> y = StateVector<1>::Zero();
    y = RungeKutta4::Solve<1>(f, 0.0, 0.5, y);
    y = RungeKutta4::Solve<1>(f, 0.5, 0.5, y);
    EXPECT_NEAR(y(0), 1.0 / 3.0, 1e-12);
}

TEST(RungeKutta4Test, OscillatorConservesEnergy) {
    StateVector<2> y;
    y << 1.0, 0.0;
    const double dt = 0.01;
    double t = 0.0;
    for (int i = 0; i < 100; ++i) {
        y = RungeKutta4::Solve<2>(Oscillator, t, dt, y);
        t += dt;
    }
    EXPECT_NEAR(y(0), std::cos(2.0 * t), 1e-7);
    EXPECT_NEAR(y(1), -2.0 * std::sin(2.0 * t), 1e-7);

    const double energy = 0.5 * y(1) * y(1) + 2.0 * y(0) * y(0);
    EXPECT_NEAR(energy, 2.0, 1e-7);
}

TEST(RungeKutta4Test, MoreAccurateThanEuler) {
    StateVector<1> rk;
    rk << 1.0;
    StateVector<1> euler = rk;
    double t = 0.0;
    const double dt = 0.1;
    for (int i = 0; i < 10; ++i) {
        rk = RungeKutta4::Solve<1>(Decay, t, dt, rk);
        euler = ForwardEuler::Solve<1>(Decay, t, dt, euler);
        t += dt;
    }
    const double exact = std::exp(-1.0);
    EXPECT_LT(std::abs(rk(0) - exact), std::abs(euler(0) - exact));
    EXPECT_EQ(RungeKutta4::Name(), "RK4");
    EXPECT_EQ(RungeKutta4::Order(), 4);
}

} // namespace
} // namespace sigflow
