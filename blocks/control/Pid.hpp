#pragma once

/**
 * @file Pid.hpp
 * @brief Discrete PID controller
 */

#include <sigflow/core/Block.hpp>
#include <sigflow/io/ParameterStore.hpp>
#include <sigflow/signal/Port.hpp>

#include <yaml-cpp/yaml.h>

#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace sigflow {
namespace blocks {

/**
 * @brief PID gains and initial integrator state
 *
 * YAML Format:
 * @code
 * kp: 2.0
 * ki: 0.5
 * kd: 0.1
 * acc0: 0.0
 * @endcode
 */
template <typename T> struct PidParams {
    T kp{};
    T ki{};
    T kd{};
    T acc0{}; ///< Initial integrator value
};

/**
 * @brief PID on the error signal `u`
 *
 * With `e` the current error and `acc` the integrator:
 * ```
 * der = (e - e_prev) / dt
 * int = acc + e·dt
 * y   = kp·e + ki·int + kd·der
 * ```
 * after which `acc = int` and `e_prev = e`. The previous error starts at 0,
 * so the first derivative term is `e / dt`.
 *
 * Ports:
 * - in `u` [T] (error)
 * - out `y` [T] (command)
 */
template <typename T> class Pid : public Block {
    static_assert(std::is_floating_point_v<T>, "Pid requires a floating-point signal type");

  public:
    Pid(std::string name, PidParams<T> params)
        : name_(std::move(name)), params_(std::move(params)), acc_(params_.acc0) {}

    [[nodiscard]] static std::unique_ptr<Pid> FromStore(const std::string &name,
                                                        ParameterStore &store,
                                                        const PidParams<T> &defaults) {
        return std::make_unique<Pid>(name, store.GetBlockParams(name, defaults));
    }

    // =========================================================================
    // Block Identity
    // =========================================================================

    [[nodiscard]] std::string Name() const override { return name_; }
    [[nodiscard]] std::string TypeName() const override { return "Pid"; }

    [[nodiscard]] InputPortMap InputPorts() override { return {{"u", &u_}}; }
    [[nodiscard]] OutputPortMap OutputPorts() override { return {{"y", &y_}}; }

    // =========================================================================
    // Execution
    // =========================================================================

    StepResult Step(const StepInfo &info) override {
        const T err = u_.Get();
        const T dt = static_cast<T>(info.dt);

        const T der = (err - last_err_) / dt;
        const T integral = acc_ + err * dt;
        y_.Set(params_.kp * err + params_.ki * integral + params_.kd * der);

        last_err_ = err;
        acc_ = integral;
        return StepResult::Continue;
    }

    // =========================================================================
    // State Access
    // =========================================================================

    [[nodiscard]] const PidParams<T> &Params() const { return params_; }
    [[nodiscard]] T Integrator() const { return acc_; }
    [[nodiscard]] T LastError() const { return last_err_; }

  private:
    std::string name_;
    PidParams<T> params_;
    T acc_;
    T last_err_{};

    InputPort<T> u_{"u"};
    OutputPort<T> y_{"y"};
};

} // namespace blocks
} // namespace sigflow

namespace YAML {

template <typename T> struct convert<sigflow::blocks::PidParams<T>> {
    static Node encode(const sigflow::blocks::PidParams<T> &p) {
        Node node;
        node["kp"] = p.kp;
        node["ki"] = p.ki;
        node["kd"] = p.kd;
        node["acc0"] = p.acc0;
        return node;
    }

    static bool decode(const Node &node, sigflow::blocks::PidParams<T> &p) {
        if (!node.IsMap()) {
            return false;
        }
        for (const char *key : {"kp", "ki", "kd", "acc0"}) {
            if (!node[key]) {
                return false;
            }
        }
        p.kp = node["kp"].template as<T>();
        p.ki = node["ki"].template as<T>();
        p.kd = node["kd"].template as<T>();
        p.acc0 = node["acc0"].template as<T>();
        return true;
    }
};

} // namespace YAML
