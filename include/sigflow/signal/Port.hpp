#pragma once

/**
 * @file Port.hpp
 * @brief Typed input/output port handles for blocks
 *
 * Output ports own their signal cell from construction and are named when the
 * builder registers the block. Input ports are connected to a producer's cell
 * at build time. The type check happens once at connection; Get()/Set() use
 * the cached typed cell.
 */

#include <sigflow/core/Error.hpp>
#include <sigflow/signal/Signal.hpp>

#include <optional>
#include <string>
#include <typeindex>
#include <utility>

namespace sigflow {

// Forward declarations
class SystemBuilder;

// =============================================================================
// Type-erased bases (builder-facing)
// =============================================================================

/**
 * @brief Type-erased view of an input port
 */
class InputPortBase {
  public:
    virtual ~InputPortBase() = default;

    /// Type identity of the values this port reads
    [[nodiscard]] virtual std::type_index Type() const = 0;

    /// Readable name of the value type
    [[nodiscard]] virtual std::string TypeName() const = 0;

    /**
     * @brief Bind this port to a producer's signal cell
     *
     * @throws LifecycleError if already connected
     * @throws TypeMismatchError if the signal holds a different type
     */
    virtual void Connect(const AnySignal &signal) = 0;

    /// Check if a signal can be connected without a type error
    [[nodiscard]] bool Accepts(const AnySignal &signal) const {
        return signal.IsValid() && signal.Type() == Type();
    }

    [[nodiscard]] bool IsConnected() const { return signal_.IsValid(); }

    /// Connected signal (invalid until Connect)
    [[nodiscard]] const AnySignal &Signal() const { return signal_; }

    /// Name of the connected signal (empty until Connect)
    [[nodiscard]] const std::string &SignalName() const { return signal_.Name(); }

    /// Local port name (may be empty for anonymous ports)
    [[nodiscard]] const std::string &PortName() const { return name_; }

  protected:
    explicit InputPortBase(std::string name) : name_(std::move(name)) {}

    [[nodiscard]] std::string DisplayName() const {
        return name_.empty() ? std::string("(input)") : name_;
    }

    std::string name_;
    AnySignal signal_;
};

/**
 * @brief Type-erased view of an output port
 */
class OutputPortBase {
  public:
    virtual ~OutputPortBase() = default;

    [[nodiscard]] std::type_index Type() const { return signal_.Type(); }
    [[nodiscard]] std::string TypeName() const { return signal_.TypeName(); }

    /// The produced signal cell (always valid)
    [[nodiscard]] const AnySignal &Signal() const { return signal_; }

    /// Name of the produced signal (empty until bound)
    [[nodiscard]] const std::string &SignalName() const { return signal_.Name(); }

    [[nodiscard]] bool IsBound() const { return bound_; }

    [[nodiscard]] const std::string &PortName() const { return name_; }

    /**
     * @brief Name the produced signal
     *
     * @throws LifecycleError if already bound
     */
    void Bind(const std::string &signal_name) {
        if (bound_) {
            throw LifecycleError("output port '" + DisplayName() + "' is already bound to '" +
                                 signal_.Name() + "'");
        }
        signal_.SetName(signal_name);
        bound_ = true;
    }

  protected:
    OutputPortBase(std::string name, AnySignal signal)
        : name_(std::move(name)), signal_(std::move(signal)) {}

    [[nodiscard]] std::string DisplayName() const {
        return name_.empty() ? std::string("(output)") : name_;
    }

    std::string name_;
    AnySignal signal_;
    bool bound_ = false;
};

// =============================================================================
// Typed ports (block-facing)
// =============================================================================

/**
 * @brief Read side of a signal
 *
 * Usage:
 * @code
 *   InputPort<double> u_{"u"};
 *   ...
 *   double e = u_.Get();   // throws if unwired or never written
 * @endcode
 *
 * @tparam T The value type
 */
template <typename T> class InputPort final : public InputPortBase {
  public:
    explicit InputPort(std::string name = "") : InputPortBase(std::move(name)) {}

    InputPort(const InputPort &) = delete;
    InputPort &operator=(const InputPort &) = delete;

    [[nodiscard]] std::type_index Type() const override { return std::type_index(typeid(T)); }
    [[nodiscard]] std::string TypeName() const override { return SignalTypeName<T>(); }

    void Connect(const AnySignal &signal) override {
        if (IsConnected()) {
            throw LifecycleError("input port '" + DisplayName() + "' is already connected to '" +
                                 signal_.Name() + "'");
        }
        cell_ = &signal.Typed<T>();
        signal_ = signal;
    }

    /**
     * @brief Current value of the connected signal
     *
     * @throws UnwiredInputError if not connected
     * @throws SignalError (Empty) if the producer has not written yet
     */
    [[nodiscard]] const T &Get() const {
        if (cell_ == nullptr) {
            throw UnwiredInputError(DisplayName());
        }
        if (!cell_->value) {
            throw SignalError::Empty(signal_.Name());
        }
        return *cell_->value;
    }

    /**
     * @brief Current value, or std::nullopt if not written yet
     *
     * @throws UnwiredInputError if not connected
     */
    [[nodiscard]] std::optional<T> TryGet() const {
        if (cell_ == nullptr) {
            throw UnwiredInputError(DisplayName());
        }
        return cell_->value;
    }

  private:
    const detail::TypedSignalCell<T> *cell_ = nullptr;
};

/**
 * @brief Write side of a signal; owns the cell
 *
 * @tparam T The value type
 */
template <typename T> class OutputPort final : public OutputPortBase {
  public:
    explicit OutputPort(std::string name = "")
        : OutputPortBase(std::move(name), AnySignal::Create<T>()),
          cell_(&signal_.Typed<T>()) {}

    OutputPort(const OutputPort &) = delete;
    OutputPort &operator=(const OutputPort &) = delete;

    /**
     * @brief Write the value for the current step
     *
     * @throws SignalError (Unbound) if the builder has not named this port
     */
    void Set(T value) {
        if (!bound_) {
            throw SignalError::Unbound(DisplayName());
        }
        cell_->value = std::move(value);
    }

    /// Last written value (std::nullopt before the first write)
    [[nodiscard]] const std::optional<T> &Value() const { return cell_->value; }

  private:
    detail::TypedSignalCell<T> *cell_;
};

} // namespace sigflow
