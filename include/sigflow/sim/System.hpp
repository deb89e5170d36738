#pragma once

/**
 * @file System.hpp
 * @brief Built, runnable block system
 *
 * A System owns its blocks in execution order together with the step state
 * `{k, t, dt}`. It is produced by SystemBuilder::Build() and never changes
 * structure afterwards.
 */

#include <sigflow/core/Block.hpp>
#include <sigflow/core/CoreTypes.hpp>
#include <sigflow/core/Error.hpp>
#include <sigflow/io/IntrospectionGraph.hpp>
#include <sigflow/signal/Signal.hpp>
#include <sigflow/sim/DependencyGraph.hpp>
#include <sigflow/sim/SystemParams.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sigflow {

/**
 * @brief Runnable system of wired blocks
 *
 * Usage:
 * @code
 *   System sys = builder.Build("counter", SystemParams{.dt = 0.1, .max_iter = 10});
 *   while (sys.Step() == StepResult::Continue) {
 *   }
 *   auto sum = sys.Peek<double>("sum");
 * @endcode
 */
class System {
  public:
    /// A block with its cached identity
    struct ScheduledBlock {
        std::unique_ptr<Block> block;
        std::string name;
        std::string type;
    };

    /// Copy of a signal read by delayed blocks, refreshed at the end of each step
    struct LatchedSignal {
        AnySignal source;
        AnySignal latch;
    };

    System(std::string name, SystemParams params, std::vector<ScheduledBlock> blocks,
           std::map<std::string, AnySignal> signals, std::vector<LatchedSignal> latches,
           DependencyGraph scheduling_graph, DependencyGraph full_graph);

    System(System &&) = default;
    System &operator=(System &&) = default;
    System(const System &) = delete;
    System &operator=(const System &) = delete;

    // =========================================================================
    // Execution
    // =========================================================================

    /**
     * @brief Execute one step of every block in execution order
     *
     * A block requesting Stop does not cut the step short. After all blocks ran
     * the signals read by delayed blocks are latched, then `k` and `t` advance.
     *
     * @return Stop if any block requested it or `k` exceeded `max_iter`
     * @throws Whatever a block throws; the rest of the step is skipped and
     *         `k`/`t` are not advanced
     */
    StepResult Step();

    /**
     * @brief Step until Stop, or until `max_steps` steps ran (0 = no limit)
     *
     * @return Number of steps executed
     */
    std::uint64_t Run(std::uint64_t max_steps = 0);

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] const std::string &Name() const { return name_; }
    [[nodiscard]] const SystemParams &Params() const { return params_; }

    /// Step counter of the next step to execute (1-based)
    [[nodiscard]] std::uint64_t K() const { return info_.k; }

    /// Simulated time at the beginning of the next step
    [[nodiscard]] double Time() const { return info_.t; }

    [[nodiscard]] double Dt() const { return info_.dt; }
    [[nodiscard]] std::uint64_t MaxIter() const { return params_.max_iter; }

    [[nodiscard]] std::size_t NumBlocks() const { return blocks_.size(); }

    /// Block names in the order Step() runs them
    [[nodiscard]] std::vector<std::string> ExecutionOrder() const;

    /// Delay-filtered graph used for ordering
    [[nodiscard]] const DependencyGraph &SchedulingGraph() const { return scheduling_graph_; }

    /// Every signal connection, including delayed ones
    [[nodiscard]] const DependencyGraph &FullGraph() const { return full_graph_; }

    [[nodiscard]] bool HasSignal(const std::string &signal) const {
        return signals_.contains(signal);
    }

    /// Names of all signals, sorted
    [[nodiscard]] std::vector<std::string> SignalNames() const;

    /**
     * @brief Read a signal's current value without affecting the run
     *
     * @return The value, or std::nullopt if its producer has not written yet
     * @throws SignalNotFoundError if no such signal exists
     * @throws TypeMismatchError if T is not the signal's type
     */
    template <typename T> [[nodiscard]] std::optional<T> Peek(const std::string &signal) const {
        auto it = signals_.find(signal);
        if (it == signals_.end()) {
            throw SignalNotFoundError(signal);
        }
        return it->second.TryGet<T>();
    }

    /**
     * @brief Blocks with typed ports plus every signal connection
     */
    [[nodiscard]] IntrospectionGraph GetIntrospectionGraph() const;

  private:
    std::string name_;
    SystemParams params_;
    StepInfo info_;
    std::vector<ScheduledBlock> blocks_;
    std::map<std::string, AnySignal> signals_;
    std::vector<LatchedSignal> latches_;
    DependencyGraph scheduling_graph_;
    DependencyGraph full_graph_;
};

} // namespace sigflow
