#pragma once

/**
 * @file Signal.hpp
 * @brief Type-erased signal cell shared between one producer and its consumers
 *
 * A signal holds at most one value of a type fixed at creation. The concrete
 * type is erased behind AnySignal so that heterogeneous blocks share one
 * connection mechanism; the type identity is kept for runtime validation.
 */

#include <sigflow/core/Error.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>

namespace sigflow {

// =============================================================================
// TypeTraits - readable type names for diagnostics
// =============================================================================

/**
 * @brief Primary template for TypeTraits
 *
 * Unspecialized types fall back to the implementation-defined typeid name.
 * Specializations provide a stable, readable name for error messages.
 *
 * @tparam T The signal value type
 */
template <typename T> struct TypeTraits {};

template <> struct TypeTraits<double> {
    static constexpr const char *name = "Double";
};

template <> struct TypeTraits<float> {
    static constexpr const char *name = "Float";
};

template <> struct TypeTraits<int32_t> {
    static constexpr const char *name = "Int32";
};

template <> struct TypeTraits<int64_t> {
    static constexpr const char *name = "Int64";
};

template <> struct TypeTraits<uint32_t> {
    static constexpr const char *name = "UInt32";
};

template <> struct TypeTraits<uint64_t> {
    static constexpr const char *name = "UInt64";
};

template <> struct TypeTraits<bool> {
    static constexpr const char *name = "Bool";
};

template <> struct TypeTraits<std::string> {
    static constexpr const char *name = "String";
};

/**
 * @brief Readable name for a signal value type
 */
template <typename T> [[nodiscard]] std::string SignalTypeName() {
    if constexpr (requires { TypeTraits<T>::name; }) {
        return TypeTraits<T>::name;
    } else {
        return typeid(T).name();
    }
}

// =============================================================================
// Cell storage
// =============================================================================

namespace detail {

/**
 * @brief Untyped part of a signal cell: name and type identity
 */
struct SignalCell {
    SignalCell(std::type_index t, std::string tname) : type(t), type_name(std::move(tname)) {}
    virtual ~SignalCell() = default;

    SignalCell(const SignalCell &) = delete;
    SignalCell &operator=(const SignalCell &) = delete;

    [[nodiscard]] virtual bool has_value() const = 0;
    virtual void reset() = 0;

    /// Fresh empty cell of the same value type
    [[nodiscard]] virtual std::shared_ptr<SignalCell> make_empty() const = 0;

    /// Copy the value slot of `other`, which must have the same type
    virtual void assign_from(const SignalCell &other) = 0;

    std::type_index type;
    std::string type_name;
    std::string name; ///< Empty until the builder binds the producer
};

/**
 * @brief Typed cell: the `std::optional<T>` value slot
 */
template <typename T> struct TypedSignalCell final : SignalCell {
    TypedSignalCell() : SignalCell(std::type_index(typeid(T)), SignalTypeName<T>()) {}

    [[nodiscard]] bool has_value() const override { return value.has_value(); }
    void reset() override { value.reset(); }

    [[nodiscard]] std::shared_ptr<SignalCell> make_empty() const override {
        return std::make_shared<TypedSignalCell<T>>();
    }

    void assign_from(const SignalCell &other) override {
        value = static_cast<const TypedSignalCell<T> &>(other).value;
    }

    std::optional<T> value;
};

} // namespace detail

// =============================================================================
// AnySignal
// =============================================================================

/**
 * @brief Shared, type-erased handle to a signal cell
 *
 * Copies of an AnySignal refer to the same cell: a write through one copy is
 * visible through every other. The value itself is copied out on read.
 *
 * Usage:
 * @code
 *   AnySignal s = AnySignal::Create<double>();
 *   s.SetName("speed");
 *   s.Set(3.0);
 *   std::optional<double> v = s.TryGet<double>();   // 3.0
 *   s.TryGet<int32_t>();                            // throws TypeMismatchError
 * @endcode
 */
class AnySignal {
  public:
    /// Default-constructed signals are invalid (no cell)
    AnySignal() = default;

    /**
     * @brief Create an empty cell holding values of type T
     */
    template <typename T> [[nodiscard]] static AnySignal Create() {
        return AnySignal(std::make_shared<detail::TypedSignalCell<T>>());
    }

    // =========================================================================
    // Identity
    // =========================================================================

    /// Check if this handle refers to a cell
    [[nodiscard]] bool IsValid() const { return cell_ != nullptr; }
    explicit operator bool() const { return IsValid(); }

    /// Signal name (empty until bound by the builder)
    [[nodiscard]] const std::string &Name() const {
        static const std::string kEmpty;
        return cell_ ? cell_->name : kEmpty;
    }

    void SetName(const std::string &name) { RequireCell("SetName").name = name; }

    /// Type identity of the stored value
    [[nodiscard]] std::type_index Type() const {
        return cell_ ? cell_->type : std::type_index(typeid(void));
    }

    /// Readable name of the stored value type
    [[nodiscard]] std::string TypeName() const { return cell_ ? cell_->type_name : "(none)"; }

    /// Check if the cell stores values of type T
    template <typename T> [[nodiscard]] bool Holds() const {
        return cell_ && cell_->type == std::type_index(typeid(T));
    }

    /// Check if two handles refer to the same cell
    [[nodiscard]] bool SharesCellWith(const AnySignal &other) const {
        return cell_ && cell_ == other.cell_;
    }

    /// Number of handles sharing this cell
    [[nodiscard]] long UseCount() const { return cell_.use_count(); }

    // =========================================================================
    // Value access (type-checked)
    // =========================================================================

    /// Check if a value has been written
    [[nodiscard]] bool HasValue() const { return cell_ && cell_->has_value(); }

    /**
     * @brief Read the current value
     * @return The value, or std::nullopt if nothing was written yet
     * @throws TypeMismatchError if T is not the declared type
     */
    template <typename T> [[nodiscard]] std::optional<T> TryGet() const {
        return Typed<T>().value;
    }

    /**
     * @brief Store a value
     * @throws TypeMismatchError if T is not the declared type
     */
    template <typename T> void Set(T value) { Typed<T>().value = std::move(value); }

    /// Drop the stored value (the cell keeps its type and name)
    void Clear() {
        if (cell_) {
            cell_->reset();
        }
    }

    /**
     * @brief New cell with the same name and type, holding no value
     */
    [[nodiscard]] AnySignal EmptyCopy() const {
        auto cell = RequireCell("EmptyCopy").make_empty();
        cell->name = cell_->name;
        return AnySignal(std::move(cell));
    }

    /**
     * @brief Copy the value of `source` (or its absence) into this cell
     * @throws TypeMismatchError if the value types differ
     */
    void AssignFrom(const AnySignal &source) {
        auto &dst = RequireCell("AssignFrom");
        const auto &src = source.RequireCell("AssignFrom");
        if (dst.type != src.type) {
            throw TypeMismatchError(DisplayName(), src.type_name, dst.type_name);
        }
        dst.assign_from(src);
    }

    /**
     * @brief Access the typed cell after checking the type
     *
     * Ports call this once at bind time and cache the result.
     *
     * @throws TypeMismatchError if T is not the declared type
     */
    template <typename T> [[nodiscard]] detail::TypedSignalCell<T> &Typed() const {
        auto &cell = RequireCell("access");
        if (cell.type != std::type_index(typeid(T))) {
            throw TypeMismatchError(DisplayName(), SignalTypeName<T>(), cell.type_name);
        }
        return static_cast<detail::TypedSignalCell<T> &>(cell);
    }

  private:
    explicit AnySignal(std::shared_ptr<detail::SignalCell> cell) : cell_(std::move(cell)) {}

    [[nodiscard]] detail::SignalCell &RequireCell(const char *operation) const {
        if (!cell_) {
            throw SignalError(SignalErrorKind::NotFound, "(invalid)",
                              std::string("no cell for ") + operation);
        }
        return *cell_;
    }

    [[nodiscard]] std::string DisplayName() const {
        return Name().empty() ? std::string("(unnamed)") : Name();
    }

    std::shared_ptr<detail::SignalCell> cell_;
};

} // namespace sigflow
