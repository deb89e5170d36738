#pragma once

/**
 * @file SystemBuilder.hpp
 * @brief Fluent builder that wires blocks into a runnable System
 *
 * The builder registers blocks with their port-to-signal connections,
 * validates the wiring, builds the dependency graphs and computes the
 * execution order. It is single-use: Open -> Built.
 */

#include <sigflow/core/Block.hpp>
#include <sigflow/core/CoreTypes.hpp>
#include <sigflow/core/Error.hpp>
#include <sigflow/signal/Signal.hpp>
#include <sigflow/sim/System.hpp>
#include <sigflow/sim/SystemParams.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sigflow {

class ParameterStore;

/// `{local port, signal name}` pairs
using Connections = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Fluent builder for System
 *
 * Usage:
 * @code
 *   SystemBuilder builder;
 *   builder.AddBlock(std::make_unique<blocks::Constant<double>>("one", blocks::ConstantParams<double>{1.0}),
 *                    {}, {{"y", "one"}})
 *       .AddBlock(std::make_unique<blocks::DelayLine<double>>("z", blocks::DelayParams<double>{{0.0}}),
 *                 {{"u", "sum"}}, {{"y", "feedback"}})
 *       .AddBlock(std::make_unique<blocks::Add<double>>("adder", blocks::AddParams<double>{{1.0, 1.0}}),
 *                 {{"u1", "one"}, {"u2", "feedback"}}, {{"y", "sum"}});
 *   System sys = builder.Build("counter", SystemParams{.dt = 1.0, .max_iter = 10});
 * @endcode
 */
class SystemBuilder {
  public:
    SystemBuilder() = default;

    SystemBuilder(const SystemBuilder &) = delete;
    SystemBuilder &operator=(const SystemBuilder &) = delete;

    // =========================================================================
    // Registration
    // =========================================================================

    /**
     * @brief Register a block with its connections
     *
     * Every declared input and output port needs exactly one connection. All
     * checks run before anything is recorded; a rejected block leaves the
     * builder unchanged. Output ports are bound to their signals here, inputs
     * are connected by Build().
     *
     * @param block Owned block instance
     * @param inputs `{input port, signal}` pairs
     * @param outputs `{output port, signal}` pairs
     * @return Reference to builder for chaining
     *
     * @throws BuildError DuplicateBlockName, UnknownPort, MultipleProducers,
     *         UnconnectedPorts
     * @throws LifecycleError after Build()
     */
    SystemBuilder &AddBlock(std::unique_ptr<Block> block, const Connections &inputs,
                            const Connections &outputs);

    // =========================================================================
    // Build
    // =========================================================================

    /**
     * @brief Validate the wiring and produce the runnable System
     *
     * On failure the builder stays Open and no input is connected.
     *
     * @throws BuildError UnknownSignal, TypeError, CycleDetected
     * @throws ConfigError if `params.dt` is not positive
     * @throws LifecycleError if already built
     */
    [[nodiscard]] System Build(const std::string &name, const SystemParams &params);

    /**
     * @brief Build with system parameters loaded through a parameter store
     */
    [[nodiscard]] System Build(const std::string &name, ParameterStore &store,
                               const SystemParams &defaults = {});

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] std::size_t NumBlocks() const { return blocks_.size(); }
    [[nodiscard]] bool HasBlock(const std::string &name) const {
        return block_index_.contains(name);
    }
    [[nodiscard]] bool HasSignal(const std::string &name) const { return signals_.contains(name); }
    [[nodiscard]] bool IsBuilt() const { return state_ == BuilderState::Built; }
    [[nodiscard]] BuilderState State() const { return state_; }

    /// Producing block of a signal (empty if unknown)
    [[nodiscard]] std::string ProducerOf(const std::string &signal) const {
        auto it = signals_.find(signal);
        return it == signals_.end() ? std::string() : it->second.producer;
    }

  private:
    struct BlockEntry {
        std::unique_ptr<Block> block;
        std::string name;
        std::string type;
        std::uint32_t delay = 0;
        std::map<std::string, std::string> inputs;  ///< port -> signal
        std::map<std::string, std::string> outputs; ///< port -> signal
    };

    struct SignalEntry {
        AnySignal signal;
        std::string producer;
        std::string port;
    };

    void RequireOpen(const char *operation) const;

    /// Match connections against declared ports (UnknownPort, UnconnectedPorts)
    template <typename PortMap>
    [[nodiscard]] static std::map<std::string, std::string>
    MatchConnections(const std::string &block, const PortMap &ports, const Connections &conns);

    void ValidateInputs() const;

    std::vector<BlockEntry> blocks_;
    std::unordered_map<std::string, std::size_t> block_index_;
    std::map<std::string, SignalEntry> signals_;
    BuilderState state_ = BuilderState::Open;
};

} // namespace sigflow
