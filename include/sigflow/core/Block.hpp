#pragma once

/**
 * @file Block.hpp
 * @brief Base class for all blocks
 *
 * A block is a named unit with typed ports and private state, updated once
 * per step. The builder and runtime only ever see this interface.
 */

#include <sigflow/core/CoreTypes.hpp>
#include <sigflow/signal/Port.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sigflow {

/// Local port name -> type-erased input port (owned by the block)
using InputPortMap = std::map<std::string, InputPortBase *>;

/// Local port name -> type-erased output port (owned by the block)
using OutputPortMap = std::map<std::string, OutputPortBase *>;

/**
 * @brief Base class for all blocks
 *
 * **Contract:**
 * - Name() is unique within a system.
 * - InputPorts()/OutputPorts() return the same ports on every call; the
 *   pointers stay valid for the block's lifetime.
 * - Delay() > 0 declares that the outputs do not depend on the current
 *   step's inputs. Such a block may close a feedback loop.
 * - Step() reads inputs, writes every output, and returns Stop to request
 *   termination. Hard failures are reported by throwing.
 */
class Block {
  public:
    virtual ~Block() = default;

    Block() = default;
    Block(const Block &) = delete;
    Block &operator=(const Block &) = delete;

    // =========================================================================
    // Identity & Ports
    // =========================================================================

    /**
     * @brief Block instance name (e.g., "controller")
     */
    [[nodiscard]] virtual std::string Name() const = 0;

    /**
     * @brief Block type name for diagnostics (e.g., "Pid")
     */
    [[nodiscard]] virtual std::string TypeName() const { return Name(); }

    [[nodiscard]] virtual InputPortMap InputPorts() { return {}; }

    [[nodiscard]] virtual OutputPortMap OutputPorts() { return {}; }

    /**
     * @brief Number of steps between an input and its effect on the outputs
     */
    [[nodiscard]] virtual std::uint32_t Delay() const { return 0; }

    // =========================================================================
    // Execution
    // =========================================================================

    /**
     * @brief Advance the block by one step (hot path)
     *
     * @param info Current step counter, time and time increment
     */
    virtual StepResult Step(const StepInfo &info) = 0;
};

// =============================================================================
// Port arrays
// =============================================================================

/**
 * @brief Allocate an indexed family of ports named base1..baseN
 */
template <typename PortT>
[[nodiscard]] std::vector<std::unique_ptr<PortT>> MakePortArray(const std::string &base,
                                                                std::size_t count) {
    std::vector<std::unique_ptr<PortT>> ports;
    ports.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        ports.push_back(std::make_unique<PortT>(IndexedPortName(base, i + 1)));
    }
    return ports;
}

/**
 * @brief Expose a port family in a port map as base1..baseN
 *
 * Usage:
 * @code
 *   InputPortMap InputPorts() override {
 *       InputPortMap ports;
 *       AddPortArray(ports, "u", inputs_);
 *       return ports;
 *   }
 * @endcode
 */
template <typename Map, typename PortT>
void AddPortArray(Map &map, const std::string &base,
                  const std::vector<std::unique_ptr<PortT>> &ports) {
    for (std::size_t i = 0; i < ports.size(); ++i) {
        map[IndexedPortName(base, i + 1)] = ports[i].get();
    }
}

} // namespace sigflow
