#pragma once

/**
 * @file Error.hpp
 * @brief Consolidated error handling for SigFlow
 *
 * Provides a flattened exception hierarchy with a handful of error categories.
 * Each category has contextual information rather than many subclasses.
 */

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sigflow {

// =============================================================================
// Error Severity
// =============================================================================

enum class Severity : uint8_t {
    INFO,    ///< Informational (logged, no action)
    WARNING, ///< Warning
    ERROR,   ///< Error (operation failed, caller may fix and retry)
    FATAL    ///< Fatal (internal consistency violated)
};

// =============================================================================
// Structured error record (for logging)
// =============================================================================

struct ErrorRecord {
    Severity severity;
    std::string message;
    std::string block;
    double time = 0.0;
};

// =============================================================================
// Base Exception
// =============================================================================

/**
 * @brief Base class for all SigFlow exceptions
 *
 * All SigFlow exceptions carry:
 * - A severity level (defaults to ERROR)
 * - A category string for logging context
 */
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &msg, Severity severity = Severity::ERROR,
                   std::string category = "general")
        : std::runtime_error("[sigflow] " + msg), severity_(severity),
          category_(std::move(category)) {}

    [[nodiscard]] Severity severity() const { return severity_; }
    [[nodiscard]] const std::string &category() const { return category_; }

    /// Convert to ErrorRecord for log integration
    [[nodiscard]] ErrorRecord toRecord(double time = 0.0, const std::string &block = "") const {
        return ErrorRecord{.severity = severity_,
                           .message = what(),
                           .block = block.empty() ? category_ : block,
                           .time = time};
    }

  protected:
    Severity severity_;
    std::string category_;
};

// =============================================================================
// Build Errors
// =============================================================================

/**
 * @brief Structural wiring errors reported by the SystemBuilder
 */
enum class BuildErrorKind {
    DuplicateBlockName, ///< A block with the same name is already registered
    UnknownPort,        ///< A connection names a port the block does not declare
    UnknownSignal,      ///< An input is wired to a signal nobody produces
    MultipleProducers,  ///< A signal already has a producing output
    UnconnectedPorts,   ///< Declared ports without a connection
    TypeError,          ///< Input type differs from the signal's value type
    CycleDetected       ///< Zero-delay dependency cycle
};

/// Human-readable name of a BuildErrorKind
inline const char *ToString(BuildErrorKind kind) {
    switch (kind) {
    case BuildErrorKind::DuplicateBlockName:
        return "DuplicateBlockName";
    case BuildErrorKind::UnknownPort:
        return "UnknownPort";
    case BuildErrorKind::UnknownSignal:
        return "UnknownSignal";
    case BuildErrorKind::MultipleProducers:
        return "MultipleProducers";
    case BuildErrorKind::UnconnectedPorts:
        return "UnconnectedPorts";
    case BuildErrorKind::TypeError:
        return "TypeError";
    case BuildErrorKind::CycleDetected:
        return "CycleDetected";
    }
    return "Unknown";
}

/**
 * @brief Build-time wiring error
 *
 * Non-retryable: the caller must fix the wiring. Messages embed the offending
 * block, port and signal names.
 */
class BuildError : public Error {
  public:
    BuildError(BuildErrorKind kind, std::string block, std::vector<std::string> ports,
               std::string signal, const std::string &message)
        : Error("Build: " + message, Severity::ERROR, "build"), kind_(kind),
          block_(std::move(block)), ports_(std::move(ports)), signal_(std::move(signal)) {}

    [[nodiscard]] BuildErrorKind kind() const { return kind_; }
    [[nodiscard]] const std::string &block() const { return block_; }
    [[nodiscard]] const std::vector<std::string> &ports() const { return ports_; }
    [[nodiscard]] const std::string &signal() const { return signal_; }

    /// First offending port (empty if none)
    [[nodiscard]] std::string port() const { return ports_.empty() ? "" : ports_.front(); }

    // Convenience factory methods

    static BuildError DuplicateBlockName(const std::string &block) {
        return {BuildErrorKind::DuplicateBlockName, block, {}, "",
                "a block named '" + block + "' is already present in the system"};
    }

    static BuildError UnknownPort(const std::string &block, const std::string &port,
                                  const std::string &detail = "") {
        std::string msg = "no port named '" + port + "' in block '" + block + "'";
        if (!detail.empty()) {
            msg = "port '" + port + "' of block '" + block + "' " + detail;
        }
        return {BuildErrorKind::UnknownPort, block, {port}, "", msg};
    }

    static BuildError UnknownSignal(const std::string &block, const std::string &port,
                                    const std::string &signal) {
        return {BuildErrorKind::UnknownSignal, block, {port}, signal,
                "could not connect port '" + port + "' of block '" + block +
                    "': no signal named '" + signal + "'"};
    }

    static BuildError MultipleProducers(const std::string &block, const std::string &port,
                                        const std::string &signal,
                                        const std::string &existing_producer) {
        return {BuildErrorKind::MultipleProducers, block, {port}, signal,
                "cannot connect output '" + port + "' of block '" + block + "' to signal '" +
                    signal + "': already produced by '" + existing_producer + "'"};
    }

    static BuildError UnconnectedPorts(const std::string &block,
                                       const std::vector<std::string> &ports) {
        std::string list;
        for (const auto &p : ports) {
            if (!list.empty()) {
                list += ", ";
            }
            list += "'" + p + "'";
        }
        return {BuildErrorKind::UnconnectedPorts, block, ports, "",
                "ports [" + list + "] in block '" + block + "' have not been connected"};
    }

    static BuildError TypeError(const std::string &block, const std::string &port,
                                const std::string &signal, const std::string &port_type,
                                const std::string &signal_type) {
        return {BuildErrorKind::TypeError, block, {port}, signal,
                "port '" + port + "' of block '" + block + "' expects signal '" + signal +
                    "' to be a '" + port_type + "', but it is a '" + signal_type + "'"};
    }

    static BuildError CycleDetected(const std::string &block, const std::string &cycle) {
        return {BuildErrorKind::CycleDetected, block, {}, "",
                "system presents a cycle containing block '" + block + "' (" + cycle + ")"};
    }

  private:
    BuildErrorKind kind_;
    std::string block_;
    std::vector<std::string> ports_;
    std::string signal_;
};

// =============================================================================
// Signal Errors
// =============================================================================

/**
 * @brief Signal-related error categories
 */
enum class SignalErrorKind {
    NotFound,     ///< Signal does not exist
    TypeMismatch, ///< Requested type differs from the declared type
    Unwired,      ///< Input port read before being connected
    Unbound,      ///< Output port written before the builder named it
    Empty         ///< Signal read before its producer wrote it
};

/**
 * @brief Signal-related errors (resolution, access)
 */
class SignalError : public Error {
  public:
    SignalError(SignalErrorKind kind, const std::string &signal_name,
                const std::string &detail = "")
        : Error(FormatMessage(kind, signal_name, detail), KindToSeverity(kind), "signal"),
          kind_(kind), signal_name_(signal_name) {}

    [[nodiscard]] SignalErrorKind kind() const { return kind_; }
    [[nodiscard]] const std::string &signal_name() const { return signal_name_; }

    // Convenience factory methods
    static SignalError NotFound(const std::string &name) {
        return {SignalErrorKind::NotFound, name};
    }

    static SignalError Unbound(const std::string &port) {
        return {SignalErrorKind::Unbound, port, "output port is not bound to a signal"};
    }

    static SignalError Empty(const std::string &name) {
        return {SignalErrorKind::Empty, name, "no value written yet"};
    }

  private:
    static Severity KindToSeverity(SignalErrorKind kind) {
        switch (kind) {
        case SignalErrorKind::NotFound:
            return Severity::ERROR;
        case SignalErrorKind::TypeMismatch:
            return Severity::FATAL; // Wiring validation was bypassed
        case SignalErrorKind::Unwired:
            return Severity::FATAL;
        case SignalErrorKind::Unbound:
            return Severity::FATAL;
        case SignalErrorKind::Empty:
            return Severity::ERROR;
        }
        return Severity::ERROR;
    }

    static std::string FormatMessage(SignalErrorKind kind, const std::string &name,
                                     const std::string &detail) {
        std::string prefix;
        switch (kind) {
        case SignalErrorKind::NotFound:
            prefix = "Signal not found";
            break;
        case SignalErrorKind::TypeMismatch:
            prefix = "Type mismatch";
            break;
        case SignalErrorKind::Unwired:
            prefix = "Unwired input";
            break;
        case SignalErrorKind::Unbound:
            prefix = "Unbound output";
            break;
        case SignalErrorKind::Empty:
            prefix = "Empty signal";
            break;
        }
        std::string msg = "Signal: " + prefix + ": '" + name + "'";
        if (!detail.empty()) {
            msg += " (" + detail + ")";
        }
        return msg;
    }

    SignalErrorKind kind_;
    std::string signal_name_;
};

// Signal error subtypes - must be classes for EXPECT_THROW compatibility
class TypeMismatchError : public SignalError {
  public:
    TypeMismatchError(const std::string &name, const std::string &expected,
                      const std::string &actual)
        : SignalError(SignalErrorKind::TypeMismatch, name,
                      "expected " + expected + ", got " + actual) {}
};

class SignalNotFoundError : public SignalError {
  public:
    explicit SignalNotFoundError(const std::string &name)
        : SignalError(SignalErrorKind::NotFound, name) {}
};

class UnwiredInputError : public SignalError {
  public:
    explicit UnwiredInputError(const std::string &name)
        : SignalError(SignalErrorKind::Unwired, name) {}
};

// =============================================================================
// Configuration Errors
// =============================================================================

/**
 * @brief Configuration/parsing errors with optional file context
 */
class ConfigError : public Error {
  public:
    explicit ConfigError(const std::string &msg)
        : Error("Config: " + msg, Severity::ERROR, "config") {}

    ConfigError(const std::string &message, const std::string &file, const std::string &key)
        : Error(FormatMessage(message, file, key), Severity::ERROR, "config"), file_(file),
          key_(key) {}

    [[nodiscard]] const std::string &file() const { return file_; }
    [[nodiscard]] const std::string &key() const { return key_; }

  private:
    static std::string FormatMessage(const std::string &msg, const std::string &file,
                                     const std::string &key) {
        std::string result = "Config: " + msg;
        if (!key.empty()) {
            result += "\n  key: " + key;
        }
        if (!file.empty()) {
            result += "\n  at: " + file;
        }
        return result;
    }

    std::string file_;
    std::string key_;
};

// =============================================================================
// Lifecycle Errors
// =============================================================================

/**
 * @brief Lifecycle ordering/state errors (builder reuse, port rebinding)
 */
class LifecycleError : public Error {
  public:
    explicit LifecycleError(const std::string &msg)
        : Error("Lifecycle: " + msg, Severity::ERROR, "lifecycle") {}
};

// =============================================================================
// Step Errors
// =============================================================================

/**
 * @brief Runtime failure raised by a block during Step()
 */
class StepError : public Error {
  public:
    explicit StepError(const std::string &msg)
        : Error("Step: " + msg, Severity::ERROR, "step") {}

    StepError(const std::string &block, std::uint64_t k, const std::string &reason)
        : Error("Step: block '" + block + "' failed at k=" + std::to_string(k) + ": " + reason,
                Severity::ERROR, "step"),
          block_(block), k_(k) {}

    [[nodiscard]] const std::string &block() const { return block_; }
    [[nodiscard]] std::optional<std::uint64_t> k() const { return k_; }

  private:
    std::string block_;
    std::optional<std::uint64_t> k_;
};

// =============================================================================
// I/O Errors
// =============================================================================

/**
 * @brief File and I/O operation errors
 */
class IOError : public Error {
  public:
    explicit IOError(const std::string &msg) : Error("IO: " + msg, Severity::ERROR, "io") {}

    IOError(const std::string &operation, const std::string &path, const std::string &reason)
        : Error("IO: " + operation + " '" + path + "': " + reason, Severity::ERROR, "io"),
          path_(path) {}

    [[nodiscard]] const std::string &path() const { return path_; }

  private:
    std::string path_;
};

} // namespace sigflow
