#pragma once

/**
 * @file IntrospectionGraph.hpp
 * @brief Full signal graph of a built system, for diagnostics and tooling
 *
 * Nodes are blocks with their typed ports; edges are signal connections from
 * a producing block to a consuming block. Every connection is listed,
 * including the ones a delay removes from the scheduling graph; those carry
 * `scheduling: false`.
 *
 * ## JSON Schema
 *
 * ```json
 * {
 *   "system": "counter",
 *   "summary": { "total_blocks": 3, "total_signals": 3, "total_edges": 3 },
 *   "blocks": [
 *     { "name": "z", "type": "Delay", "delay": 1,
 *       "inputs":  [ { "port": "u", "type": "Double", "signal": "sum" } ],
 *       "outputs": [ { "port": "y", "type": "Double", "signal": "feedback" } ] }
 *   ],
 *   "edges": [
 *     { "signal": "sum", "producer": "adder", "consumer": "z", "scheduling": false }
 *   ]
 * }
 * ```
 */

#include <sigflow/io/FileIO.hpp>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <fstream>
#include <set>
#include <string>
#include <vector>

namespace sigflow {

/**
 * @brief A port as seen from outside its block
 */
struct PortInfo {
    std::string port;   ///< Local port name
    std::string type;   ///< Value type name
    std::string signal; ///< Connected signal
};

/**
 * @brief A block node
 */
struct BlockInfo {
    std::string name;
    std::string type;
    std::uint32_t delay = 0;
    std::vector<PortInfo> inputs;
    std::vector<PortInfo> outputs;
};

/**
 * @brief A single producer -> consumer signal connection
 */
struct SignalEdge {
    std::string signal;
    std::string producer;
    std::string consumer;
    bool scheduling = true; ///< False when the consumer's delay breaks the dependency
};

/**
 * @brief Complete introspection graph: block nodes + signal edges
 */
struct IntrospectionGraph {
    std::string system;
    std::vector<BlockInfo> blocks; ///< In execution order
    std::vector<SignalEdge> edges;

    /// Number of distinct signals produced in the system
    [[nodiscard]] std::size_t NumSignals() const {
        std::set<std::string> names;
        for (const auto &block : blocks) {
            for (const auto &out : block.outputs) {
                names.insert(out.signal);
            }
        }
        return names.size();
    }

    /**
     * @brief Serialize the full graph to JSON
     */
    [[nodiscard]] nlohmann::json ToJSON() const {
        nlohmann::json j;
        j["system"] = system;
        j["summary"]["total_blocks"] = blocks.size();
        j["summary"]["total_signals"] = NumSignals();
        j["summary"]["total_edges"] = edges.size();

        auto to_json_ports = [](const std::vector<PortInfo> &ports) {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto &p : ports) {
                arr.push_back({{"port", p.port}, {"type", p.type}, {"signal", p.signal}});
            }
            return arr;
        };

        j["blocks"] = nlohmann::json::array();
        for (const auto &block : blocks) {
            nlohmann::json jblock;
            jblock["name"] = block.name;
            jblock["type"] = block.type;
            jblock["delay"] = block.delay;
            jblock["inputs"] = to_json_ports(block.inputs);
            jblock["outputs"] = to_json_ports(block.outputs);
            j["blocks"].push_back(jblock);
        }

        j["edges"] = nlohmann::json::array();
        for (const auto &edge : edges) {
            nlohmann::json jedge;
            jedge["signal"] = edge.signal;
            jedge["producer"] = edge.producer;
            jedge["consumer"] = edge.consumer;
            jedge["scheduling"] = edge.scheduling;
            j["edges"].push_back(jedge);
        }
        return j;
    }

    /**
     * @brief Serialize the full graph to a YAML document
     */
    [[nodiscard]] std::string ToYAML() const {
        YAML::Emitter out;
        out << YAML::BeginMap;
        out << YAML::Key << "system" << YAML::Value << system;

        out << YAML::Key << "summary" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "total_blocks" << YAML::Value << blocks.size();
        out << YAML::Key << "total_signals" << YAML::Value << NumSignals();
        out << YAML::Key << "total_edges" << YAML::Value << edges.size();
        out << YAML::EndMap;

        auto emit_ports = [&out](const std::string &key, const std::vector<PortInfo> &ports) {
            if (ports.empty()) {
                return;
            }
            out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
            for (const auto &p : ports) {
                out << YAML::BeginMap;
                out << YAML::Key << "port" << YAML::Value << p.port;
                out << YAML::Key << "type" << YAML::Value << p.type;
                out << YAML::Key << "signal" << YAML::Value << p.signal;
                out << YAML::EndMap;
            }
            out << YAML::EndSeq;
        };

        out << YAML::Key << "blocks" << YAML::Value << YAML::BeginSeq;
        for (const auto &block : blocks) {
            out << YAML::BeginMap;
            out << YAML::Key << "name" << YAML::Value << block.name;
            out << YAML::Key << "type" << YAML::Value << block.type;
            out << YAML::Key << "delay" << YAML::Value << block.delay;
            emit_ports("inputs", block.inputs);
            emit_ports("outputs", block.outputs);
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;

        out << YAML::Key << "edges" << YAML::Value << YAML::BeginSeq;
        for (const auto &edge : edges) {
            out << YAML::BeginMap;
            out << YAML::Key << "signal" << YAML::Value << edge.signal;
            out << YAML::Key << "producer" << YAML::Value << edge.producer;
            out << YAML::Key << "consumer" << YAML::Value << edge.consumer;
            out << YAML::Key << "scheduling" << YAML::Value << edge.scheduling;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;

        out << YAML::EndMap;
        return out.c_str();
    }

    void ToJSONFile(const std::string &path) const {
        detail::WriteToFile(path, [&](std::ofstream &file) { file << ToJSON().dump(2); });
    }

    void ToYAMLFile(const std::string &path) const {
        detail::WriteToFile(path, [&](std::ofstream &file) { file << ToYAML(); });
    }
};

} // namespace sigflow
