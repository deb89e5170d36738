/**
 * @file cart_control.cpp
 * @brief PID position control of a damped cart
 *
 * ```
 *   setpoint ──►(+)── error ──► PID ── force ──► Cart ── position ─┐
 *               (-)▲                                                │
 *                  └────────────────────────────────────────────────┘
 * ```
 * The cart integrates `m·a = F - b·v` with RK4. It holds its state across a
 * step (Delay() = 1), which is what makes the closed loop legal.
 *
 * Parameters come from a YAML file (first argument, default
 * `cart_params.yaml`). Missing entries fall back to the defaults below and the
 * effective values are written back so the file can be edited between runs.
 */

#include <sigflow/sigflow.hpp>

#include <control/Pid.hpp>
#include <math/Add.hpp>
#include <sinks/Probe.hpp>
#include <sources/Constant.hpp>

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace cart {

using sigflow::StateVector;

/// Cart physical parameters and initial state
struct CartParams {
    double mass = 1.0;    ///< [kg]
    double damping = 0.5; ///< Viscous friction [N·s/m]
    double x0 = 0.0;      ///< Initial position [m]
    double v0 = 0.0;      ///< Initial velocity [m/s]
};

/**
 * @brief Point-mass cart on a line
 *
 * Ports:
 * - in `force` [N]
 * - out `position` [m], `velocity` [m/s]
 */
class Cart : public sigflow::Block {
  public:
    Cart(std::string name, CartParams params) : name_(std::move(name)), params_(params) {
        state_ << params_.x0, params_.v0;
    }

    [[nodiscard]] std::string Name() const override { return name_; }
    [[nodiscard]] std::string TypeName() const override { return "Cart"; }

    [[nodiscard]] sigflow::InputPortMap InputPorts() override { return {{"force", &force_}}; }
    [[nodiscard]] sigflow::OutputPortMap OutputPorts() override {
        return {{"position", &position_}, {"velocity", &velocity_}};
    }

    [[nodiscard]] std::uint32_t Delay() const override { return 1; }

    sigflow::StepResult Step(const sigflow::StepInfo &info) override {
        // The force read here was produced by the previous step
        if (info.k > 1) {
            const double force = force_.Get();
            const double t_prev = info.t - info.dt;
            auto dynamics = [this, force](double /*t*/, const StateVector<2> &y) {
                StateVector<2> dy;
                dy << y(1), (force - params_.damping * y(1)) / params_.mass;
                return dy;
            };
            state_ = sigflow::RungeKutta4::Solve<2>(dynamics, t_prev, info.dt, state_);
        }
        position_.Set(state_(0));
        velocity_.Set(state_(1));
        return sigflow::StepResult::Continue;
    }

  private:
    std::string name_;
    CartParams params_;
    StateVector<2> state_;

    sigflow::InputPort<double> force_{"force"};
    sigflow::OutputPort<double> position_{"position"};
    sigflow::OutputPort<double> velocity_{"velocity"};
};

} // namespace cart

namespace YAML {

template <> struct convert<cart::CartParams> {
    static Node encode(const cart::CartParams &p) {
        Node node;
        node["mass"] = p.mass;
        node["damping"] = p.damping;
        node["x0"] = p.x0;
        node["v0"] = p.v0;
        return node;
    }

    static bool decode(const Node &node, cart::CartParams &p) {
        if (!node.IsMap()) {
            return false;
        }
        p.mass = node["mass"].as<double>();
        p.damping = node["damping"].as<double>();
        p.x0 = node["x0"].as<double>();
        p.v0 = node["v0"].as<double>();
        return true;
    }
};

} // namespace YAML

using namespace sigflow;
using namespace sigflow::blocks;

int main(int argc, char **argv) {
    const std::string params_path = argc > 1 ? argv[1] : "cart_params.yaml";

    Console console;
    LogSinks::Apply(GetLogService(), LogConfig::Default(), console);

    try {
        ParameterStore store(params_path, "cart");

        auto plant = store.GetBlockParams("cart", cart::CartParams{});
        if (plant.mass <= 0.0) {
            throw ConfigError("mass must be positive", params_path, "cart.blocks.cart.mass");
        }

        // Log the position once per simulated second
        auto monitor = [](const std::string &signal, const std::optional<double> &value,
                          const StepInfo &info) {
            if (value && std::fmod(info.t, 1.0) < 0.5 * info.dt) {
                SIGFLOW_LOG_INFO(info.t, signal + " = " + Console::FormatNumber(*value, 4));
            }
        };

        SystemBuilder builder;
        builder
            .AddBlock(Constant<double>::FromStore("setpoint", store, ConstantParams<double>{1.0}),
                      {}, {{"y", "setpoint"}})
            .AddBlock(std::make_unique<Add<double>>("error", AddParams<double>{{1.0, -1.0}}),
                      {{"u1", "setpoint"}, {"u2", "position"}}, {{"y", "error"}})
            .AddBlock(Pid<double>::FromStore("controller", store,
                                             PidParams<double>{8.0, 2.0, 3.0, 0.0}),
                      {{"u", "error"}}, {{"y", "force"}})
            .AddBlock(std::make_unique<cart::Cart>("cart", plant), {{"force", "force"}},
                      {{"position", "position"}, {"velocity", "velocity"}})
            .AddBlock(std::make_unique<Probe<double>>("monitor", monitor), {{"u", "position"}},
                      {});

        System sys = builder.Build("cart", store, SystemParams{.dt = 0.01, .max_iter = 1000});
        store.Save();

        GetLogService().Info(0.0, "Execution order: " + [&sys] {
            std::string order;
            for (const auto &name : sys.ExecutionOrder()) {
                order += (order.empty() ? "" : " -> ") + name;
            }
            return order;
        }());

        sys.Run();

        const double position = sys.Peek<double>("position").value_or(0.0);
        const double velocity = sys.Peek<double>("velocity").value_or(0.0);
        GetLogService().Info(sys.Time(), "Final position " + Console::FormatNumber(position, 4) +
                                             " m, velocity " + Console::FormatNumber(velocity, 4) +
                                             " m/s");

        sys.GetIntrospectionGraph().ToYAMLFile("cart_graph.yaml");
    } catch (const Error &e) {
        LogError(e);
        return 1;
    } catch (const std::exception &e) {
        GetLogService().Error(0.0, e.what());
        return 1;
    }
    return 0;
}
