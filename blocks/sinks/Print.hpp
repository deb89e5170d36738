#pragma once

/**
 * @file Print.hpp
 * @brief Sink block that logs its input every step
 */

#include <sigflow/core/Block.hpp>
#include <sigflow/io/LogService.hpp>
#include <sigflow/signal/Port.hpp>

#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace sigflow {
namespace blocks {

/**
 * @brief Logs `signal = value` at Info level
 *
 * The runtime has already set the block context, so each entry carries the
 * simulated time and `system.block`. T needs a stream insertion operator.
 *
 * Ports:
 * - in `u` [T]
 */
template <typename T> class Print : public Block {
  public:
    explicit Print(std::string name, int precision = 6)
        : name_(std::move(name)), precision_(precision) {}

    [[nodiscard]] std::string Name() const override { return name_; }
    [[nodiscard]] std::string TypeName() const override { return "Print"; }

    [[nodiscard]] InputPortMap InputPorts() override { return {{"u", &u_}}; }

    StepResult Step(const StepInfo &info) override {
        SIGFLOW_LOG_INFO(info.t, u_.SignalName() + " = " + FormatValue(u_.TryGet()));
        return StepResult::Continue;
    }

  private:
    [[nodiscard]] std::string FormatValue(const std::optional<T> &value) const {
        if (!value) {
            return "<empty>";
        }
        std::ostringstream oss;
        oss << std::setprecision(precision_) << *value;
        return oss.str();
    }

    std::string name_;
    int precision_;
    InputPort<T> u_{"u"};
};

} // namespace blocks
} // namespace sigflow
