/**
 * @file System.cpp
 * @brief Runtime stepping loop and introspection
 */

#include <sigflow/core/ErrorLogging.hpp>
#include <sigflow/io/LogService.hpp>
#include <sigflow/sim/System.hpp>

#include <exception>
#include <utility>

namespace sigflow {

System::System(std::string name, SystemParams params, std::vector<ScheduledBlock> blocks,
               std::map<std::string, AnySignal> signals, std::vector<LatchedSignal> latches,
               DependencyGraph scheduling_graph, DependencyGraph full_graph)
    : name_(std::move(name)), params_(params), info_(StepInfo::Initial(params.dt)),
      blocks_(std::move(blocks)), signals_(std::move(signals)), latches_(std::move(latches)),
      scheduling_graph_(std::move(scheduling_graph)), full_graph_(std::move(full_graph)) {}

StepResult System::Step() {
    LogService::BufferedScope buffered(GetLogService());

    bool stop = false;
    for (auto &entry : blocks_) {
        LogContextManager::ScopedContext ctx(name_, entry.name, entry.type);
        try {
            if (entry.block->Step(info_) == StepResult::Stop) {
                stop = true;
            }
        } catch (const Error &e) {
            LogError(e, info_.t, entry.name);
            throw;
        } catch (const std::exception &e) {
            GetLogService().Error(info_.t, "step " + std::to_string(info_.k) + " failed: " +
                                               e.what());
            throw;
        }
    }

    // Delayed blocks see this step's values on the next step
    for (auto &latched : latches_) {
        latched.latch.AssignFrom(latched.source);
    }

    if (stop) {
        SIGFLOW_LOG_DEBUG(info_.t, "Stop requested at k=" + std::to_string(info_.k));
    }

    info_.Advance();

    if (stop || (params_.max_iter > 0 && info_.k > params_.max_iter)) {
        return StepResult::Stop;
    }
    return StepResult::Continue;
}

std::uint64_t System::Run(std::uint64_t max_steps) {
    std::uint64_t executed = 0;
    while (max_steps == 0 || executed < max_steps) {
        ++executed;
        if (Step() == StepResult::Stop) {
            break;
        }
    }
    return executed;
}

std::vector<std::string> System::ExecutionOrder() const {
    std::vector<std::string> order;
    order.reserve(blocks_.size());
    for (const auto &entry : blocks_) {
        order.push_back(entry.name);
    }
    return order;
}

std::vector<std::string> System::SignalNames() const {
    std::vector<std::string> names;
    names.reserve(signals_.size());
    for (const auto &[name, signal] : signals_) {
        names.push_back(name);
    }
    return names;
}

IntrospectionGraph System::GetIntrospectionGraph() const {
    IntrospectionGraph graph;
    graph.system = name_;

    for (const auto &entry : blocks_) {
        BlockInfo info;
        info.name = entry.name;
        info.type = entry.type;
        info.delay = entry.block->Delay();
        for (const auto &[port, input] : entry.block->InputPorts()) {
            info.inputs.push_back({port, input->TypeName(), input->SignalName()});
        }
        for (const auto &[port, output] : entry.block->OutputPorts()) {
            info.outputs.push_back({port, output->TypeName(), output->SignalName()});
        }
        graph.blocks.push_back(std::move(info));
    }

    for (const auto &edge : full_graph_.GetEdges()) {
        bool scheduling = false;
        for (const auto &dependent : scheduling_graph_.GetDependents(edge.producer)) {
            if (dependent == edge.consumer) {
                scheduling = true;
                break;
            }
        }
        for (const auto &signal : edge.signals) {
            graph.edges.push_back({signal, edge.producer, edge.consumer, scheduling});
        }
    }

    return graph;
}

} // namespace sigflow
