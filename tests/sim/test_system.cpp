/**
 * @file test_system.cpp
 * @brief Tests for System stepping semantics
 */

#include <gtest/gtest.h>
#include <sigflow/core/Block.hpp>
#include <sigflow/core/Error.hpp>
#include <sigflow/io/LogService.hpp>
#include <sigflow/sim/SystemBuilder.hpp>

#include <discrete/DelayLine.hpp>
#include <math/Add.hpp>
#include <sinks/Probe.hpp>
#include <sources/Constant.hpp>
#include <sources/Generator.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sigflow {
namespace {

using blocks::Add;
using blocks::AddParams;
using blocks::Constant;
using blocks::ConstantParams;
using blocks::DelayLine;
using blocks::DelayParams;
using blocks::Generator;
using blocks::Probe;

/// Requests Stop at one step and counts its calls
class StopAt : public Block {
  public:
    StopAt(std::string name, std::uint64_t k, int *calls) : name_(std::move(name)), k_(k), calls_(calls) {}

    [[nodiscard]] std::string Name() const override { return name_; }

    StepResult Step(const StepInfo &info) override {
        ++*calls_;
        return info.k == k_ ? StepResult::Stop : StepResult::Continue;
    }

  private:
    std::string name_;
    std::uint64_t k_;
    int *calls_;
};

/// Throws at one step
class FailAt : public Block {
  public:
    FailAt(std::string name, std::uint64_t k) : name_(std::move(name)), k_(k) {}

    [[nodiscard]] std::string Name() const override { return name_; }
    [[nodiscard]] std::string TypeName() const override { return "FailAt"; }
    [[nodiscard]] OutputPortMap OutputPorts() override { return {{"y", &y_}}; }

    StepResult Step(const StepInfo &info) override {
        if (info.k == k_) {
            throw StepError(name_, info.k, "sensor dropout");
        }
        y_.Set(static_cast<double>(info.k));
        return StepResult::Continue;
    }

  private:
    std::string name_;
    std::uint64_t k_;
    OutputPort<double> y_{"y"};
};

/// Counts its calls
class Counter : public Block {
  public:
    Counter(std::string name, int *calls) : name_(std::move(name)), calls_(calls) {}

    [[nodiscard]] std::string Name() const override { return name_; }

    StepResult Step(const StepInfo &) override {
        ++*calls_;
        return StepResult::Continue;
    }

  private:
    std::string name_;
    int *calls_;
};

System BuildCounter(std::uint64_t max_iter) {
    SystemBuilder builder;
    builder.AddBlock(std::make_unique<Constant<double>>("one", ConstantParams<double>{1.0}), {},
                     {{"y", "one"}})
        .AddBlock(std::make_unique<DelayLine<double>>("z", DelayParams<double>{{0.0}}),
                  {{"u", "sum"}}, {{"y", "feedback"}})
        .AddBlock(std::make_unique<Add<double>>("adder", AddParams<double>{{1.0, 1.0}}),
                  {{"u1", "one"}, {"u2", "feedback"}}, {{"y", "sum"}});
    return builder.Build("counter", SystemParams{.dt = 1.0, .max_iter = max_iter});
}

// =============================================================================
// Scenarios
// =============================================================================

TEST(SystemTest, AcyclicSum) {
    SystemBuilder builder;
    builder.AddBlock(std::make_unique<Add<double>>("sum", AddParams<double>{{1.0, 1.0}}),
                     {{"u1", "c1"}, {"u2", "c2"}}, {{"y", "sum"}})
        .AddBlock(std::make_unique<Constant<double>>("c1", ConstantParams<double>{3.0}), {},
                  {{"y", "c1"}})
        .AddBlock(std::make_unique<Constant<double>>("c2", ConstantParams<double>{4.0}), {},
                  {{"y", "c2"}});
    System sys = builder.Build("acyclic", SystemParams{});

    EXPECT_EQ(sys.ExecutionOrder(), (std::vector<std::string>{"c1", "c2", "sum"}));
    EXPECT_FALSE(sys.Peek<double>("sum").has_value());

    EXPECT_EQ(sys.Step(), StepResult::Continue);
    EXPECT_EQ(sys.Peek<double>("sum"), 7.0);
}

TEST(SystemTest, DelayedFeedbackCounts) {
    System sys = BuildCounter(0);
    EXPECT_EQ(sys.ExecutionOrder(), (std::vector<std::string>{"one", "z", "adder"}));

    for (int k = 1; k <= 10; ++k) {
        sys.Step();
        EXPECT_EQ(sys.Peek<double>("sum"), static_cast<double>(k)) << "k=" << k;
    }
    EXPECT_EQ(sys.K(), 11u);
    EXPECT_DOUBLE_EQ(sys.Time(), 10.0);
}

TEST(SystemTest, MaxIterStopsAfterExactlyThatManySteps) {
    System sys = BuildCounter(5);

    int steps = 0;
    StepResult result = StepResult::Continue;
    while (result == StepResult::Continue) {
        result = sys.Step();
        ++steps;
    }
    EXPECT_EQ(steps, 5);
    EXPECT_EQ(sys.Peek<double>("sum"), 5.0);
}

TEST(SystemTest, RunHonorsStopAndLimit) {
    System bounded = BuildCounter(5);
    EXPECT_EQ(bounded.Run(), 5u);

    System unbounded = BuildCounter(0);
    EXPECT_EQ(unbounded.Run(3), 3u);
    EXPECT_EQ(unbounded.Peek<double>("sum"), 3.0);
    EXPECT_EQ(unbounded.Run(2), 2u);
    EXPECT_EQ(unbounded.Peek<double>("sum"), 5.0);
}

// =============================================================================
// Step Semantics
// =============================================================================

TEST(SystemTest, StepInfoSeenByBlocks) {
    std::vector<StepInfo> seen;
    SystemBuilder builder;
    builder
        .AddBlock(std::make_unique<Constant<double>>("c", ConstantParams<double>{0.0}), {},
                  {{"y", "c"}})
        .AddBlock(std::make_unique<Probe<double>>(
                      "probe", [&](const std::string &, const std::optional<double> &,
                                   const StepInfo &info) { seen.push_back(info); }),
                  {{"u", "c"}}, {});
    System sys = builder.Build("timing", SystemParams{.dt = 0.5, .max_iter = 0});

    sys.Run(3);
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0].k, 1u);
    EXPECT_DOUBLE_EQ(seen[0].t, 0.0);
    EXPECT_EQ(seen[2].k, 3u);
    EXPECT_DOUBLE_EQ(seen[2].t, 1.0);
    EXPECT_DOUBLE_EQ(seen[2].dt, 0.5);
}

TEST(SystemTest, StopDoesNotCutTheStepShort) {
    int stopper_calls = 0;
    int later_calls = 0;
    SystemBuilder builder;
    builder.AddBlock(std::make_unique<StopAt>("stopper", 2, &stopper_calls), {}, {})
        .AddBlock(std::make_unique<Counter>("later", &later_calls), {}, {});
    System sys = builder.Build("stop", SystemParams{});

    EXPECT_EQ(sys.Step(), StepResult::Continue);
    EXPECT_EQ(sys.Step(), StepResult::Stop);
    EXPECT_EQ(stopper_calls, 2);
    EXPECT_EQ(later_calls, 2);
    EXPECT_EQ(sys.K(), 3u);

    // Stop is advisory
    EXPECT_EQ(sys.Step(), StepResult::Continue);
    EXPECT_EQ(later_calls, 3);
}

TEST(SystemTest, BlockExceptionPropagatesWithoutAdvancing) {
    int after_calls = 0;
    SystemBuilder builder;
    builder.AddBlock(std::make_unique<FailAt>("sensor", 2), {}, {{"y", "reading"}})
        .AddBlock(std::make_unique<Counter>("after", &after_calls), {}, {});
    System sys = builder.Build("faulty", SystemParams{.dt = 0.1, .max_iter = 0});

    sys.Step();
    EXPECT_EQ(after_calls, 1);

    try {
        sys.Step();
        FAIL() << "expected StepError";
    } catch (const StepError &e) {
        EXPECT_EQ(e.block(), "sensor");
        EXPECT_EQ(e.k(), std::optional<std::uint64_t>(2));
    }

    EXPECT_EQ(after_calls, 1);
    EXPECT_EQ(sys.K(), 2u);
    EXPECT_DOUBLE_EQ(sys.Time(), 0.1);
    // Values written before the failure are kept
    EXPECT_EQ(sys.Peek<double>("reading"), 1.0);
}

TEST(SystemTest, BlockFailureIsLoggedWithBlockContext) {
    auto &log = GetLogService();
    std::vector<LogEntry> captured;
    log.ClearSinks();
    log.AddSink([&](const std::vector<LogEntry> &entries) {
        captured.insert(captured.end(), entries.begin(), entries.end());
    });

    SystemBuilder builder;
    builder.AddBlock(std::make_unique<FailAt>("sensor", 1), {}, {{"y", "reading"}});
    System sys = builder.Build("faulty", SystemParams{});
    captured.clear();

    EXPECT_THROW(sys.Step(), StepError);
    log.ClearSinks();

    ASSERT_FALSE(captured.empty());
    const LogEntry &last = captured.back();
    EXPECT_EQ(last.level, LogLevel::Error);
    EXPECT_EQ(last.context.system, "faulty");
    EXPECT_EQ(last.context.block, "sensor");
    EXPECT_NE(last.message.find("sensor dropout"), std::string::npos);
}

TEST(SystemTest, DelayedBlockLatchesPreviousStepRegardlessOfRegistration) {
    int next = 0;
    std::vector<std::optional<double>> delayed;
    SystemBuilder builder;
    builder
        .AddBlock(std::make_unique<Generator<double>>("gen",
                                                      [&] { return static_cast<double>(++next); }),
                  {}, {{"y", "ramp"}})
        .AddBlock(std::make_unique<DelayLine<double>>("z", DelayParams<double>{{-1.0}}),
                  {{"u", "ramp"}}, {{"y", "ramp_prev"}})
        .AddBlock(std::make_unique<Probe<double>>(
                      "probe", [&](const std::string &, const std::optional<double> &value,
                                   const StepInfo &) { delayed.push_back(value); }),
                  {{"u", "ramp_prev"}}, {});
    System sys = builder.Build("ramp", SystemParams{});

    EXPECT_EQ(sys.ExecutionOrder(), (std::vector<std::string>{"gen", "z", "probe"}));
    sys.Run(4);
    ASSERT_EQ(delayed.size(), 4u);
    EXPECT_EQ(delayed[0], -1.0);
    EXPECT_EQ(delayed[1], 1.0);
    EXPECT_EQ(delayed[2], 2.0);
    EXPECT_EQ(delayed[3], 3.0);
}

/// Ramp -> d1 -> d2 -> probe, with the delays registered in either order
std::vector<std::optional<double>> RunDelayChain(bool reader_first, int steps) {
    auto next = std::make_shared<int>(0);
    auto seen = std::make_shared<std::vector<std::optional<double>>>();

    auto d1 = [] {
        return std::make_unique<DelayLine<double>>("d1", DelayParams<double>{{0.0}});
    };
    auto d2 = [] {
        return std::make_unique<DelayLine<double>>("d2", DelayParams<double>{{0.0}});
    };

    SystemBuilder builder;
    builder.AddBlock(std::make_unique<Generator<double>>(
                         "gen", [next] { return static_cast<double>(++*next); }),
                     {}, {{"y", "ramp"}});
    if (reader_first) {
        builder.AddBlock(d2(), {{"u", "r1"}}, {{"y", "r2"}});
        builder.AddBlock(d1(), {{"u", "ramp"}}, {{"y", "r1"}});
    } else {
        builder.AddBlock(d1(), {{"u", "ramp"}}, {{"y", "r1"}});
        builder.AddBlock(d2(), {{"u", "r1"}}, {{"y", "r2"}});
    }
    builder.AddBlock(std::make_unique<Probe<double>>(
                         "probe", [seen](const std::string &, const std::optional<double> &value,
                                         const StepInfo &) { seen->push_back(value); }),
                     {{"u", "r2"}}, {});

    System sys = builder.Build("chain", SystemParams{});
    sys.Run(static_cast<std::uint64_t>(steps));
    return *seen;
}

TEST(SystemTest, DelayChainAddsUpDelaysInAnyRegistrationOrder) {
    const std::vector<std::optional<double>> expected = {0.0, 0.0, 1.0, 2.0, 3.0};
    EXPECT_EQ(RunDelayChain(false, 5), expected);
    EXPECT_EQ(RunDelayChain(true, 5), expected);
}

TEST(SystemTest, LoopOfDelaysSwapsValuesEachStep) {
    for (bool first_is_a : {true, false}) {
        SystemBuilder builder;
        auto a = std::make_unique<DelayLine<double>>("a", DelayParams<double>{{1.0}});
        auto b = std::make_unique<DelayLine<double>>("b", DelayParams<double>{{2.0}});
        if (first_is_a) {
            builder.AddBlock(std::move(a), {{"u", "sb"}}, {{"y", "sa"}});
            builder.AddBlock(std::move(b), {{"u", "sa"}}, {{"y", "sb"}});
        } else {
            builder.AddBlock(std::move(b), {{"u", "sa"}}, {{"y", "sb"}});
            builder.AddBlock(std::move(a), {{"u", "sb"}}, {{"y", "sa"}});
        }
        System sys = builder.Build("swap", SystemParams{});

        for (int k = 1; k <= 4; ++k) {
            sys.Step();
            const bool odd = (k % 2) == 1;
            EXPECT_EQ(sys.Peek<double>("sa"), odd ? 1.0 : 2.0) << "k=" << k;
            EXPECT_EQ(sys.Peek<double>("sb"), odd ? 2.0 : 1.0) << "k=" << k;
        }
    }
}

TEST(SystemTest, TwoStepDelayInFeedbackLoop) {
    SystemBuilder builder;
    builder.AddBlock(std::make_unique<Constant<double>>("one", ConstantParams<double>{1.0}), {},
                     {{"y", "one"}})
        .AddBlock(std::make_unique<DelayLine<double>>("z", DelayParams<double>{{0.0, 0.0}}),
                  {{"u", "sum"}}, {{"y", "feedback"}})
        .AddBlock(std::make_unique<Add<double>>("adder", AddParams<double>{{1.0, 1.0}}),
                  {{"u1", "one"}, {"u2", "feedback"}}, {{"y", "sum"}});
    System sys = builder.Build("counter2", SystemParams{});

    // sum_k = 1 + sum_{k-2}, with sum_{-1} = sum_0 = 0
    const std::vector<double> expected = {1, 1, 2, 2, 3, 3, 4, 4};
    for (std::size_t i = 0; i < expected.size(); ++i) {
        sys.Step();
        EXPECT_EQ(sys.Peek<double>("sum"), expected[i]) << "k=" << i + 1;
    }
}

TEST(SystemTest, IdenticalSystemsProduceIdenticalRuns) {
    System a = BuildCounter(0);
    System b = BuildCounter(0);
    EXPECT_EQ(a.ExecutionOrder(), b.ExecutionOrder());

    for (int i = 0; i < 20; ++i) {
        a.Step();
        b.Step();
        ASSERT_EQ(a.Peek<double>("sum"), b.Peek<double>("sum"));
        ASSERT_EQ(a.Peek<double>("feedback"), b.Peek<double>("feedback"));
    }
}

// =============================================================================
// Queries
// =============================================================================

TEST(SystemTest, PeekErrors) {
    System sys = BuildCounter(0);
    EXPECT_THROW((void)sys.Peek<double>("nope"), SignalNotFoundError);
    EXPECT_THROW((void)sys.Peek<int32_t>("sum"), TypeMismatchError);
}

TEST(SystemTest, SignalNamesSorted) {
    System sys = BuildCounter(0);
    EXPECT_EQ(sys.SignalNames(), (std::vector<std::string>{"feedback", "one", "sum"}));
    EXPECT_TRUE(sys.HasSignal("one"));
    EXPECT_FALSE(sys.HasSignal("two"));
}

TEST(SystemTest, SystemIsMovable) {
    System sys = BuildCounter(0);
    sys.Run(2);
    System moved = std::move(sys);
    moved.Step();
    EXPECT_EQ(moved.Peek<double>("sum"), 3.0);
}

TEST(SystemTest, IntrospectionGraphMarksSchedulingEdges) {
    System sys = BuildCounter(0);
    IntrospectionGraph graph = sys.GetIntrospectionGraph();

    EXPECT_EQ(graph.system, "counter");
    ASSERT_EQ(graph.blocks.size(), 3u);
    EXPECT_EQ(graph.blocks[1].name, "z");
    EXPECT_EQ(graph.blocks[1].type, "Delay");
    EXPECT_EQ(graph.blocks[1].delay, 1u);
    ASSERT_EQ(graph.edges.size(), 3u);

    for (const auto &edge : graph.edges) {
        if (edge.signal == "sum") {
            EXPECT_EQ(edge.producer, "adder");
            EXPECT_EQ(edge.consumer, "z");
            EXPECT_FALSE(edge.scheduling);
        } else {
            EXPECT_EQ(edge.consumer, "adder");
            EXPECT_TRUE(edge.scheduling);
        }
    }
}

} // namespace
} // namespace sigflow
