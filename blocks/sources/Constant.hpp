#pragma once

/**
 * @file Constant.hpp
 * @brief Source block emitting a fixed value
 */

#include <sigflow/core/Block.hpp>
#include <sigflow/io/ParameterStore.hpp>
#include <sigflow/signal/Port.hpp>

#include <yaml-cpp/yaml.h>

#include <memory>
#include <string>
#include <utility>

namespace sigflow {
namespace blocks {

/**
 * @brief Parameters of Constant
 *
 * YAML Format:
 * @code
 * c: 1.0
 * @endcode
 */
template <typename T> struct ConstantParams {
    T c{};
};

/**
 * @brief Writes `y = c` every step
 *
 * Ports:
 * - out `y` [T]
 */
template <typename T> class Constant : public Block {
  public:
    Constant(std::string name, ConstantParams<T> params)
        : name_(std::move(name)), params_(std::move(params)) {}

    /// Build with parameters resolved through a parameter store
    [[nodiscard]] static std::unique_ptr<Constant> FromStore(const std::string &name,
                                                             ParameterStore &store,
                                                             const ConstantParams<T> &defaults) {
        return std::make_unique<Constant>(name, store.GetBlockParams(name, defaults));
    }

    // =========================================================================
    // Block Identity
    // =========================================================================

    [[nodiscard]] std::string Name() const override { return name_; }
    [[nodiscard]] std::string TypeName() const override { return "Constant"; }

    [[nodiscard]] OutputPortMap OutputPorts() override { return {{"y", &y_}}; }

    // =========================================================================
    // Execution
    // =========================================================================

    StepResult Step(const StepInfo &) override {
        y_.Set(params_.c);
        return StepResult::Continue;
    }

    [[nodiscard]] const ConstantParams<T> &Params() const { return params_; }

  private:
    std::string name_;
    ConstantParams<T> params_;
    OutputPort<T> y_{"y"};
};

} // namespace blocks
} // namespace sigflow

namespace YAML {

template <typename T> struct convert<sigflow::blocks::ConstantParams<T>> {
    static Node encode(const sigflow::blocks::ConstantParams<T> &p) {
        Node node;
        node["c"] = p.c;
        return node;
    }

    static bool decode(const Node &node, sigflow::blocks::ConstantParams<T> &p) {
        if (!node.IsMap() || !node["c"]) {
            return false;
        }
        p.c = node["c"].template as<T>();
        return true;
    }
};

} // namespace YAML
