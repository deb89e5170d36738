#pragma once

/**
 * @file Probe.hpp
 * @brief Sink block forwarding its input to a callback
 */

#include <sigflow/core/Block.hpp>
#include <sigflow/core/Error.hpp>
#include <sigflow/signal/Port.hpp>

#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace sigflow {
namespace blocks {

/**
 * @brief Calls `callback(signal, value, info)` every step
 *
 * `value` is std::nullopt while the producer has not written.
 *
 * Ports:
 * - in `u` [T]
 */
template <typename T> class Probe : public Block {
  public:
    using Callback = std::function<void(const std::string &signal,
                                        const std::optional<T> &value, const StepInfo &info)>;

    Probe(std::string name, Callback callback)
        : name_(std::move(name)), callback_(std::move(callback)) {
        if (!callback_) {
            throw ConfigError("Probe '" + name_ + "' needs a callback");
        }
    }

    [[nodiscard]] std::string Name() const override { return name_; }
    [[nodiscard]] std::string TypeName() const override { return "Probe"; }

    [[nodiscard]] InputPortMap InputPorts() override { return {{"u", &u_}}; }

    StepResult Step(const StepInfo &info) override {
        callback_(u_.SignalName(), u_.TryGet(), info);
        return StepResult::Continue;
    }

  private:
    std::string name_;
    Callback callback_;
    InputPort<T> u_{"u"};
};

} // namespace blocks
} // namespace sigflow
