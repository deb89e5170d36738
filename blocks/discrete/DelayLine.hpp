#pragma once

/**
 * @file DelayLine.hpp
 * @brief N-step discrete delay
 *
 * A DelayLine is the block that closes feedback loops: its output at step k
 * depends only on inputs from step k - N and earlier.
 */

#include <sigflow/core/Block.hpp>
#include <sigflow/core/Error.hpp>
#include <sigflow/io/ParameterStore.hpp>
#include <sigflow/signal/Port.hpp>

#include <yaml-cpp/yaml.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sigflow {
namespace blocks {

/**
 * @brief Parameters of DelayLine
 *
 * The delay length is the number of initial values.
 *
 * YAML Format:
 * @code
 * initial_values: [0.0, 0.0]
 * @endcode
 */
template <typename T> struct DelayParams {
    std::vector<T> initial_values;
};

/**
 * @brief `y_k = u_{k-N}`, emitting the initial values for the first N steps
 *
 * Ring buffer of N slots. On the first step nothing has been produced yet, so
 * the input is not read. From the second step on, the input holds the
 * producer's value from the previous step (the system latches inputs of
 * delayed blocks) and is stored in the slot that comes due N - 1 steps later.
 *
 * Ports:
 * - in `u` [T]
 * - out `y` [T]
 */
template <typename T> class DelayLine : public Block {
  public:
    /**
     * @throws ConfigError if `params.initial_values` is empty
     */
    DelayLine(std::string name, DelayParams<T> params)
        : name_(std::move(name)), params_(std::move(params)) {
        if (params_.initial_values.empty()) {
            throw ConfigError("DelayLine '" + name_ + "' needs at least one initial value", "",
                              name_ + ".initial_values");
        }
        buffer_ = params_.initial_values;
    }

    [[nodiscard]] static std::unique_ptr<DelayLine> FromStore(const std::string &name,
                                                              ParameterStore &store,
                                                              const DelayParams<T> &defaults) {
        return std::make_unique<DelayLine>(name, store.GetBlockParams(name, defaults));
    }

    // =========================================================================
    // Block Identity
    // =========================================================================

    [[nodiscard]] std::string Name() const override { return name_; }
    [[nodiscard]] std::string TypeName() const override { return "Delay"; }

    [[nodiscard]] InputPortMap InputPorts() override { return {{"u", &u_}}; }
    [[nodiscard]] OutputPortMap OutputPorts() override { return {{"y", &y_}}; }

    [[nodiscard]] std::uint32_t Delay() const override {
        return static_cast<std::uint32_t>(buffer_.size());
    }

    // =========================================================================
    // Execution
    // =========================================================================

    StepResult Step(const StepInfo &info) override {
        const std::size_t n = buffer_.size();
        if (info.k > 1) {
            buffer_[(index_ + n - 1) % n] = u_.Get();
        }
        y_.Set(buffer_[index_]);
        index_ = (index_ + 1) % n;
        return StepResult::Continue;
    }

    [[nodiscard]] const DelayParams<T> &Params() const { return params_; }

  private:
    std::string name_;
    DelayParams<T> params_;
    std::vector<T> buffer_;
    std::size_t index_ = 0;

    InputPort<T> u_{"u"};
    OutputPort<T> y_{"y"};
};

} // namespace blocks
} // namespace sigflow

namespace YAML {

template <typename T> struct convert<sigflow::blocks::DelayParams<T>> {
    static Node encode(const sigflow::blocks::DelayParams<T> &p) {
        Node node;
        node["initial_values"] = p.initial_values;
        return node;
    }

    static bool decode(const Node &node, sigflow::blocks::DelayParams<T> &p) {
        if (!node.IsMap() || !node["initial_values"] || !node["initial_values"].IsSequence()) {
            return false;
        }
        p.initial_values = node["initial_values"].template as<std::vector<T>>();
        return true;
    }
};

} // namespace YAML
