#pragma once

/**
 * @file Generator.hpp
 * @brief Source block driven by a user function
 */

#include <sigflow/core/Block.hpp>
#include <sigflow/core/Error.hpp>
#include <sigflow/signal/Port.hpp>

#include <functional>
#include <string>
#include <utility>

namespace sigflow {
namespace blocks {

/**
 * @brief Writes `y = f()` every step
 *
 * The function is called exactly once per step, so stateful generators
 * (counters, recorded sequences) see one call per step.
 *
 * Ports:
 * - out `y` [T]
 */
template <typename T> class Generator : public Block {
  public:
    using Function = std::function<T()>;

    Generator(std::string name, Function f) : name_(std::move(name)), f_(std::move(f)) {
        if (!f_) {
            throw ConfigError("Generator '" + name_ + "' needs a callable");
        }
    }

    [[nodiscard]] std::string Name() const override { return name_; }
    [[nodiscard]] std::string TypeName() const override { return "Generator"; }

    [[nodiscard]] OutputPortMap OutputPorts() override { return {{"y", &y_}}; }

    StepResult Step(const StepInfo &) override {
        y_.Set(f_());
        return StepResult::Continue;
    }

  private:
    std::string name_;
    Function f_;
    OutputPort<T> y_{"y"};
};

} // namespace blocks
} // namespace sigflow
