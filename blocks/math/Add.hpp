#pragma once

/**
 * @file Add.hpp
 * @brief Weighted sum of N inputs
 */

#include <sigflow/core/Block.hpp>
#include <sigflow/core/Error.hpp>
#include <sigflow/io/ParameterStore.hpp>
#include <sigflow/signal/Port.hpp>

#include <yaml-cpp/yaml.h>

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sigflow {
namespace blocks {

/**
 * @brief Parameters of Add
 *
 * YAML Format:
 * @code
 * gains: [1.0, -1.0]
 * @endcode
 */
template <typename T> struct AddParams {
    std::vector<T> gains;
};

/**
 * @brief `y = gains[0]*u1 + ... + gains[N-1]*uN`
 *
 * The number of inputs follows the number of gains.
 *
 * Ports:
 * - in `u1`..`uN` [T]
 * - out `y` [T]
 */
template <typename T> class Add : public Block {
  public:
    /**
     * @throws ConfigError if `params.gains` is empty
     */
    Add(std::string name, AddParams<T> params)
        : name_(std::move(name)), params_(std::move(params)) {
        if (params_.gains.empty()) {
            throw ConfigError("Add block '" + name_ + "' needs at least one gain", "",
                              name_ + ".gains");
        }
        inputs_ = MakePortArray<InputPort<T>>("u", params_.gains.size());
    }

    [[nodiscard]] static std::unique_ptr<Add> FromStore(const std::string &name,
                                                        ParameterStore &store,
                                                        const AddParams<T> &defaults) {
        return std::make_unique<Add>(name, store.GetBlockParams(name, defaults));
    }

    // =========================================================================
    // Block Identity
    // =========================================================================

    [[nodiscard]] std::string Name() const override { return name_; }
    [[nodiscard]] std::string TypeName() const override { return "Add"; }

    [[nodiscard]] InputPortMap InputPorts() override {
        InputPortMap ports;
        AddPortArray(ports, "u", inputs_);
        return ports;
    }

    [[nodiscard]] OutputPortMap OutputPorts() override { return {{"y", &y_}}; }

    // =========================================================================
    // Execution
    // =========================================================================

    StepResult Step(const StepInfo &) override {
        T sum = params_.gains[0] * inputs_[0]->Get();
        for (std::size_t i = 1; i < inputs_.size(); ++i) {
            sum = sum + params_.gains[i] * inputs_[i]->Get();
        }
        y_.Set(sum);
        return StepResult::Continue;
    }

    [[nodiscard]] std::size_t NumInputs() const { return inputs_.size(); }
    [[nodiscard]] const AddParams<T> &Params() const { return params_; }

  private:
    std::string name_;
    AddParams<T> params_;
    std::vector<std::unique_ptr<InputPort<T>>> inputs_;
    OutputPort<T> y_{"y"};
};

} // namespace blocks
} // namespace sigflow

namespace YAML {

template <typename T> struct convert<sigflow::blocks::AddParams<T>> {
    static Node encode(const sigflow::blocks::AddParams<T> &p) {
        Node node;
        node["gains"] = p.gains;
        return node;
    }

    static bool decode(const Node &node, sigflow::blocks::AddParams<T> &p) {
        if (!node.IsMap() || !node["gains"] || !node["gains"].IsSequence()) {
            return false;
        }
        p.gains = node["gains"].template as<std::vector<T>>();
        return true;
    }
};

} // namespace YAML
