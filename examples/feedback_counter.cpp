/**
 * @file feedback_counter.cpp
 * @brief Delayed feedback loop counting 1, 2, 3, ...
 *
 * ```
 *   one ──► adder ──► sum ──► z⁻¹ ──► feedback ─┐
 *             ▲                                 │
 *             └─────────────────────────────────┘
 * ```
 * The loop is legal because the delay breaks the combinational dependency.
 * The signal graph is written as DOT and JSON next to the executable.
 */

#include <sigflow/sigflow.hpp>

#include <discrete/DelayLine.hpp>
#include <math/Add.hpp>
#include <sinks/Probe.hpp>
#include <sources/Constant.hpp>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace sigflow;
using namespace sigflow::blocks;

int main() {
    Console console;
    LogSinks::Apply(GetLogService(), LogConfig::Default(), console);

    std::cout << "=== SigFlow " << Version() << ": feedback counter ===\n\n";

    auto report = [](const std::string &signal, const std::optional<double> &value,
                     const StepInfo &info) {
        std::cout << "  k=" << info.k << "  " << signal << " = "
                  << (value ? std::to_string(*value) : std::string("<empty>")) << "\n";
    };

    SystemBuilder builder;
    builder
        .AddBlock(std::make_unique<Constant<double>>("one", ConstantParams<double>{1.0}), {},
                  {{"y", "one"}})
        .AddBlock(std::make_unique<DelayLine<double>>("z", DelayParams<double>{{0.0}}),
                  {{"u", "sum"}}, {{"y", "feedback"}})
        .AddBlock(std::make_unique<Add<double>>("adder", AddParams<double>{{1.0, 1.0}}),
                  {{"u1", "one"}, {"u2", "feedback"}}, {{"y", "sum"}})
        .AddBlock(std::make_unique<Probe<double>>("watch", report), {{"u", "sum"}}, {});

    System sys = builder.Build("counter", SystemParams{.dt = 1.0, .max_iter = 10});

    const std::uint64_t steps = sys.Run();
    std::cout << "\nStopped after " << steps << " steps, sum = "
              << sys.Peek<double>("sum").value_or(0.0) << "\n";

    // Export topology
    {
        std::ofstream dot("counter.dot");
        dot << sys.FullGraph().ToDot(sys.Name());
    }
    sys.GetIntrospectionGraph().ToJSONFile("counter.json");
    std::cout << "Wrote counter.dot and counter.json\n";
    return 0;
}
