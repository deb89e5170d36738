#pragma once

/**
 * @file SystemParams.hpp
 * @brief Runtime parameters of a system (time increment, iteration limit)
 */

#include <cstdint>

#include <yaml-cpp/yaml.h>

namespace sigflow {

/**
 * @brief Parameters of a built system
 *
 * YAML Format (under `<system>.params` in a parameter file):
 * @code
 * dt: 0.01
 * max_iter: 1000   # 0 = unbounded
 * @endcode
 */
struct SystemParams {
    double dt = 1.0;            ///< Fixed time increment [s]
    std::uint64_t max_iter = 0; ///< Stop once k exceeds this (0 = unbounded)
};

} // namespace sigflow

namespace YAML {

template <> struct convert<sigflow::SystemParams> {
    static Node encode(const sigflow::SystemParams &p) {
        Node node;
        node["dt"] = p.dt;
        node["max_iter"] = p.max_iter;
        return node;
    }

    static bool decode(const Node &node, sigflow::SystemParams &p) {
        if (!node.IsMap() || !node["dt"] || !node["max_iter"]) {
            return false;
        }
        p.dt = node["dt"].as<double>();
        p.max_iter = node["max_iter"].as<std::uint64_t>();
        return true;
    }
};

} // namespace YAML
