/**
 * @file SystemBuilder.cpp
 * @brief Wiring validation, graph construction and scheduling
 */

#include <sigflow/core/Config.hpp>
#include <sigflow/core/ErrorLogging.hpp>
#include <sigflow/io/LogService.hpp>
#include <sigflow/io/ParameterStore.hpp>
#include <sigflow/sim/DependencyGraph.hpp>
#include <sigflow/sim/SystemBuilder.hpp>

#include <sstream>

namespace sigflow {

// =============================================================================
// Registration
// =============================================================================

void SystemBuilder::RequireOpen(const char *operation) const {
    if (state_ == BuilderState::Built) {
        ThrowAndLog(LifecycleError(std::string(operation) +
                                   "() called on a builder that has already built its system"));
    }
}

template <typename PortMap>
std::map<std::string, std::string> SystemBuilder::MatchConnections(const std::string &block,
                                                                   const PortMap &ports,
                                                                   const Connections &conns) {
    std::map<std::string, std::string> matched;
    for (const auto &[port, signal] : conns) {
        if (!ports.contains(port)) {
            throw BuildError::UnknownPort(block, port);
        }
        if (!matched.emplace(port, signal).second) {
            throw BuildError::UnknownPort(block, port, "is connected more than once");
        }
    }

    std::vector<std::string> missing;
    for (const auto &[port, ptr] : ports) {
        if (!matched.contains(port)) {
            missing.push_back(port);
        }
    }
    if (!missing.empty()) {
        throw BuildError::UnconnectedPorts(block, missing);
    }
    return matched;
}

SystemBuilder &SystemBuilder::AddBlock(std::unique_ptr<Block> block, const Connections &inputs,
                                       const Connections &outputs) {
    RequireOpen("AddBlock");
    if (!block) {
        ThrowAndLog(LifecycleError("AddBlock() called with a null block"));
    }

    const std::string name = block->Name();
    if (block_index_.contains(name)) {
        ThrowAndLog(BuildError::DuplicateBlockName(name));
    }

    BlockEntry entry;
    OutputPortMap output_ports = block->OutputPorts();
    try {
        entry.inputs = MatchConnections(name, block->InputPorts(), inputs);
        entry.outputs = MatchConnections(name, output_ports, outputs);

        std::map<std::string, std::string> claimed; // signal -> port, within this block
        for (const auto &[port, signal] : entry.outputs) {
            auto existing = signals_.find(signal);
            if (existing != signals_.end()) {
                throw BuildError::MultipleProducers(name, port, signal, existing->second.producer);
            }
            if (!claimed.emplace(signal, port).second) {
                throw BuildError::MultipleProducers(name, port, signal, name);
            }
        }
    } catch (const BuildError &e) {
        LogError(e);
        throw;
    }

    for (const auto &[port, signal] : entry.outputs) {
        if (output_ports.at(port)->IsBound()) {
            ThrowAndLog(LifecycleError("output port '" + port + "' of block '" + name +
                                       "' is already bound to '" +
                                       output_ports.at(port)->SignalName() + "'"));
        }
    }

    // Commit: nothing below throws for a validated entry
    for (const auto &[port, signal] : entry.outputs) {
        OutputPortBase *out = output_ports.at(port);
        out->Bind(signal);
        signals_.emplace(signal, SignalEntry{out->Signal(), name, port});
    }

    entry.name = name;
    entry.type = block->TypeName();
    entry.delay = block->Delay();
    entry.block = std::move(block);

    SIGFLOW_LOG_DEBUG(0.0, "Registered block '" + name + "' (" + entry.type + ", delay " +
                               std::to_string(entry.delay) + "): " +
                               std::to_string(entry.inputs.size()) + " inputs, " +
                               std::to_string(entry.outputs.size()) + " outputs");

    block_index_.emplace(name, blocks_.size());
    blocks_.push_back(std::move(entry));
    return *this;
}

// =============================================================================
// Build
// =============================================================================

void SystemBuilder::ValidateInputs() const {
    for (const auto &entry : blocks_) {
        InputPortMap ports = entry.block->InputPorts();
        for (const auto &[port, signal] : entry.inputs) {
            auto it = signals_.find(signal);
            if (it == signals_.end()) {
                ThrowAndLog(BuildError::UnknownSignal(entry.name, port, signal));
            }
            const InputPortBase *input = ports.at(port);
            if (!input->Accepts(it->second.signal)) {
                ThrowAndLog(BuildError::TypeError(entry.name, port, signal, input->TypeName(),
                                                  it->second.signal.TypeName()));
            }
        }
    }
}

System SystemBuilder::Build(const std::string &name, const SystemParams &params) {
    RequireOpen("Build");
    if (!(params.dt > 0.0)) {
        ThrowAndLog(ConfigError("time increment dt must be positive, got " +
                                    std::to_string(params.dt),
                                "", name + ".params.dt"));
    }

    ValidateInputs();

    // Two separate graphs: the scheduling graph drops edges into delayed
    // consumers, the full graph keeps every connection for diagnostics.
    DependencyGraph scheduling;
    DependencyGraph full;
    for (const auto &entry : blocks_) {
        scheduling.AddNode(entry.name);
        full.AddNode(entry.name);
    }
    for (const auto &entry : blocks_) {
        for (const auto &[port, signal] : entry.inputs) {
            const std::string &producer = signals_.at(signal).producer;
            full.AddEdge(producer, entry.name, signal);
            if (entry.delay == 0) {
                scheduling.AddEdge(producer, entry.name, signal);
            }
        }
    }

    TopologyResult topo = scheduling.TopologicalSort();
    if (topo.has_cycles) {
        const CycleInfo &cycle = topo.cycles.front();
        ThrowAndLog(BuildError::CycleDetected(cycle.blocks.front(), cycle.ToString()));
    }
    SIGFLOW_ASSERT(topo.execution_order.size() == blocks_.size(),
                   "acyclic graph must order every block");

    // Validation complete: connect inputs. Delayed blocks read a latched copy
    // of their signals, refreshed after every step, so they observe the
    // previous step's value whatever the execution order.
    std::map<std::string, AnySignal> latches;
    for (auto &entry : blocks_) {
        InputPortMap ports = entry.block->InputPorts();
        for (const auto &[port, signal] : entry.inputs) {
            const AnySignal &source = signals_.at(signal).signal;
            if (entry.delay == 0) {
                ports.at(port)->Connect(source);
                continue;
            }
            auto it = latches.find(signal);
            if (it == latches.end()) {
                it = latches.emplace(signal, source.EmptyCopy()).first;
            }
            ports.at(port)->Connect(it->second);
        }
    }

    std::vector<System::LatchedSignal> latched;
    latched.reserve(latches.size());
    for (const auto &[signal_name, latch] : latches) {
        latched.push_back({signals_.at(signal_name).signal, latch});
    }

    std::vector<System::ScheduledBlock> ordered;
    ordered.reserve(blocks_.size());
    for (const auto &block_name : topo.execution_order) {
        BlockEntry &entry = blocks_[block_index_.at(block_name)];
        ordered.push_back({std::move(entry.block), entry.name, entry.type});
    }

    std::map<std::string, AnySignal> signals;
    for (const auto &[signal_name, signal] : signals_) {
        signals.emplace(signal_name, signal.signal);
    }

    state_ = BuilderState::Built;

    std::ostringstream order;
    for (std::size_t i = 0; i < topo.execution_order.size(); ++i) {
        order << (i == 0 ? "" : " -> ") << topo.execution_order[i];
    }
    SIGFLOW_LOG_INFO(0.0, "Built system '" + name + "': " + std::to_string(ordered.size()) +
                              " blocks, " + std::to_string(signals.size()) + " signals, dt=" +
                              std::to_string(params.dt));
    SIGFLOW_LOG_DEBUG(0.0, "Execution order: " + order.str());
    SIGFLOW_LOG_DEBUG(0.0, "Signal graph:\n" + full.ToDot(name));

    return {name,
            params,
            std::move(ordered),
            std::move(signals),
            std::move(latched),
            std::move(scheduling),
            std::move(full)};
}

System SystemBuilder::Build(const std::string &name, ParameterStore &store,
                            const SystemParams &defaults) {
    RequireOpen("Build");
    return Build(name, store.GetSystemParams(defaults));
}

} // namespace sigflow
