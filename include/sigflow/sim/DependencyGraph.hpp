#pragma once

/**
 * @file DependencyGraph.hpp
 * @brief Block dependency graph, topological sorting and cycle extraction
 *
 * Nodes are block names, kept in registration order. An edge A -> B labelled
 * with a signal name means B reads a signal A produces. Self-edges are real
 * edges (a block reading its own output) and form a cycle of length one.
 */

#include <cstddef>
#include <set>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sigflow {

/**
 * @brief Information about a detected cycle in the dependency graph
 */
struct CycleInfo {
    std::vector<std::string> blocks;  ///< Blocks forming the cycle, in edge order
    std::vector<std::string> signals; ///< signals[i] connects blocks[i] to blocks[i+1]

    /// "a -[s1]-> b -[s2]-> a"
    [[nodiscard]] std::string ToString() const {
        std::ostringstream oss;
        for (size_t i = 0; i < blocks.size(); ++i) {
            oss << blocks[i];
            oss << " -[" << (i < signals.size() ? signals[i] : "") << "]-> ";
        }
        if (!blocks.empty()) {
            oss << blocks[0];
        }
        return oss.str();
    }
};

/**
 * @brief Result of topological analysis
 */
struct TopologyResult {
    std::vector<std::string> execution_order; ///< Sorted block names
    std::vector<CycleInfo> cycles;            ///< Detected cycles (if any)
    bool has_cycles = false;

    [[nodiscard]] bool IsValid() const { return !has_cycles; }
};

/**
 * @brief A producer -> consumer dependency with every signal that carries it
 */
struct GraphEdge {
    std::string producer;
    std::string consumer;
    std::vector<std::string> signals;
};

/**
 * @brief Directed graph of block dependencies
 *
 * Parallel edges between the same pair are merged into one dependency; every
 * signal label is kept for export.
 */
class DependencyGraph {
  public:
    /**
     * @brief Add a node without any edges (no-op if already present)
     */
    void AddNode(const std::string &block) { IndexOf(block); }

    /**
     * @brief Add a dependency edge: producer must execute before consumer
     *
     * @param producer Block that writes the signal
     * @param consumer Block that reads the signal
     * @param signal_name Signal connecting them
     */
    void AddEdge(const std::string &producer, const std::string &consumer,
                 const std::string &signal_name) {
        std::size_t from = IndexOf(producer);
        std::size_t to = IndexOf(consumer);

        for (auto &edge : adjacency_[from]) {
            if (edge.target == to) {
                for (const auto &s : edge.signals) {
                    if (s == signal_name) {
                        return;
                    }
                }
                edge.signals.push_back(signal_name);
                return;
            }
        }
        adjacency_[from].push_back({to, {signal_name}});
        ++in_degree_[to];
    }

    /// All nodes in registration order
    [[nodiscard]] const std::vector<std::string> &GetNodes() const { return nodes_; }

    [[nodiscard]] bool HasNode(const std::string &block) const { return index_.contains(block); }

    /// All edges, grouped by producer in registration order
    [[nodiscard]] std::vector<GraphEdge> GetEdges() const {
        std::vector<GraphEdge> edges;
        for (std::size_t from = 0; from < nodes_.size(); ++from) {
            for (const auto &edge : adjacency_[from]) {
                edges.push_back({nodes_[from], nodes_[edge.target], edge.signals});
            }
        }
        return edges;
    }

    [[nodiscard]] std::size_t Size() const { return nodes_.size(); }
    [[nodiscard]] bool Empty() const { return nodes_.empty(); }

    [[nodiscard]] std::size_t NumEdges() const {
        std::size_t n = 0;
        for (const auto &edges : adjacency_) {
            n += edges.size();
        }
        return n;
    }

    /**
     * @brief Blocks that read an output of `block` (what runs after it)
     */
    [[nodiscard]] std::vector<std::string> GetDependents(const std::string &block) const {
        std::vector<std::string> deps;
        auto it = index_.find(block);
        if (it != index_.end()) {
            for (const auto &edge : adjacency_[it->second]) {
                deps.push_back(nodes_[edge.target]);
            }
        }
        return deps;
    }

    /**
     * @brief Blocks whose outputs `block` reads (what runs before it)
     */
    [[nodiscard]] std::vector<std::string> GetDependencies(const std::string &block) const {
        std::vector<std::string> deps;
        auto it = index_.find(block);
        if (it == index_.end()) {
            return deps;
        }
        for (std::size_t from = 0; from < nodes_.size(); ++from) {
            for (const auto &edge : adjacency_[from]) {
                if (edge.target == it->second) {
                    deps.push_back(nodes_[from]);
                    break;
                }
            }
        }
        return deps;
    }

    /**
     * @brief Topological sort using Kahn's algorithm
     *
     * Among ready nodes the earliest registered runs first, so the order is
     * fully determined by the registration order and the edges.
     */
    [[nodiscard]] TopologyResult TopologicalSort() const {
        TopologyResult result;
        std::vector<std::size_t> in_deg = in_degree_;

        std::set<std::size_t> ready;
        for (std::size_t i = 0; i < nodes_.size(); ++i) {
            if (in_deg[i] == 0) {
                ready.insert(i);
            }
        }

        while (!ready.empty()) {
            std::size_t node = *ready.begin();
            ready.erase(ready.begin());
            result.execution_order.push_back(nodes_[node]);

            for (const auto &edge : adjacency_[node]) {
                if (--in_deg[edge.target] == 0) {
                    ready.insert(edge.target);
                }
            }
        }

        if (result.execution_order.size() != nodes_.size()) {
            result.has_cycles = true;
            result.cycles = DetectCycles();
        }
        return result;
    }

    /**
     * @brief Detect cycles using DFS (one cycle per back edge)
     */
    [[nodiscard]] std::vector<CycleInfo> DetectCycles() const {
        std::vector<CycleInfo> cycles;
        std::vector<VisitState> state(nodes_.size(), VisitState::Unvisited);
        std::vector<std::size_t> path;
        std::vector<std::string> path_signals;

        for (std::size_t i = 0; i < nodes_.size(); ++i) {
            if (state[i] == VisitState::Unvisited) {
                DetectCyclesDFS(i, state, path, path_signals, cycles);
            }
        }
        return cycles;
    }

    /**
     * @brief Render the graph in Graphviz DOT format
     */
    [[nodiscard]] std::string ToDot(const std::string &graph_name = "system") const {
        std::ostringstream oss;
        oss << "digraph " << Quote(graph_name) << " {\n";
        oss << "  rankdir=LR;\n";
        for (const auto &node : nodes_) {
            oss << "  " << Quote(node) << ";\n";
        }
        for (std::size_t from = 0; from < nodes_.size(); ++from) {
            for (const auto &edge : adjacency_[from]) {
                std::string label;
                for (const auto &s : edge.signals) {
                    label += label.empty() ? s : ", " + s;
                }
                oss << "  " << Quote(nodes_[from]) << " -> " << Quote(nodes_[edge.target])
                    << " [label=" << Quote(label) << "];\n";
            }
        }
        oss << "}\n";
        return oss.str();
    }

  private:
    struct Edge {
        std::size_t target;
        std::vector<std::string> signals;
    };

    enum class VisitState { Unvisited, InStack, Done };

    std::size_t IndexOf(const std::string &block) {
        auto it = index_.find(block);
        if (it != index_.end()) {
            return it->second;
        }
        std::size_t idx = nodes_.size();
        nodes_.push_back(block);
        index_.emplace(block, idx);
        adjacency_.emplace_back();
        in_degree_.push_back(0);
        return idx;
    }

    void DetectCyclesDFS(std::size_t node, std::vector<VisitState> &state,
                         std::vector<std::size_t> &path, std::vector<std::string> &path_signals,
                         std::vector<CycleInfo> &cycles) const {
        state[node] = VisitState::InStack;
        path.push_back(node);

        for (const auto &edge : adjacency_[node]) {
            const std::string &label = edge.signals.front();
            if (state[edge.target] == VisitState::InStack) {
                CycleInfo cycle;
                bool in_cycle = false;
                for (std::size_t i = 0; i < path.size(); ++i) {
                    if (path[i] == edge.target) {
                        in_cycle = true;
                    }
                    if (in_cycle) {
                        cycle.blocks.push_back(nodes_[path[i]]);
                        if (i < path_signals.size()) {
                            cycle.signals.push_back(path_signals[i]);
                        }
                    }
                }
                cycle.signals.push_back(label);
                cycles.push_back(std::move(cycle));
            } else if (state[edge.target] == VisitState::Unvisited) {
                path_signals.push_back(label);
                DetectCyclesDFS(edge.target, state, path, path_signals, cycles);
                path_signals.pop_back();
            }
        }

        state[node] = VisitState::Done;
        path.pop_back();
    }

    static std::string Quote(const std::string &s) {
        std::string out = "\"";
        for (char c : s) {
            if (c == '"' || c == '\\') {
                out += '\\';
            }
            out += c;
        }
        return out + "\"";
    }

    std::vector<std::string> nodes_;
    std::unordered_map<std::string, std::size_t> index_;
    std::vector<std::vector<Edge>> adjacency_;
    std::vector<std::size_t> in_degree_;
};

} // namespace sigflow
