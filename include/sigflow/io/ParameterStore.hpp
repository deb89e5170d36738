#pragma once

/**
 * @file ParameterStore.hpp
 * @brief YAML-backed parameter store with default/override merging
 *
 * Parameters are kept per system in a single YAML file:
 *
 * @code
 * cart:
 *   params:
 *     dt: 0.01
 *     max_iter: 2000
 *   blocks:
 *     controller:
 *       kp: 2.0
 *       ki: 0.1
 * @endcode
 *
 * Values found in the file override the defaults passed by the caller, key by
 * key (nested maps are merged recursively). Every effective value is recorded
 * so that Save() writes a complete, editable file back.
 */

#include <sigflow/core/Error.hpp>
#include <sigflow/sim/SystemParams.hpp>

#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

namespace sigflow {

namespace detail {

/**
 * @brief Deep merge: keys of `overlay` replace those of `base`, maps recurse
 *
 * Neither input is modified.
 */
YAML::Node MergeNodes(const YAML::Node &base, const YAML::Node &overlay);

} // namespace detail

/**
 * @brief Persistent parameters for one system
 *
 * Parameter types take part through `YAML::convert<T>` specializations.
 *
 * Usage:
 * @code
 *   ParameterStore store("params.yaml", "cart");
 *   auto pid = store.GetBlockParams("controller", PidParams<double>{1.0, 0.0, 0.0, 0.0});
 *   auto sys = store.GetSystemParams(SystemParams{0.01, 1000});
 *   store.Save();
 * @endcode
 */
class ParameterStore {
  public:
    /**
     * @brief Open the store, loading `path` if it exists
     *
     * @throws ConfigError if the file exists but is not valid YAML
     */
    ParameterStore(std::string path, std::string system_name);

    /**
     * @brief Effective parameters of a block: stored values over `defaults`
     *
     * Reads `<system>.blocks.<block>`.
     *
     * @throws ConfigError if the merged node cannot be decoded as T
     */
    template <typename T> [[nodiscard]] T GetBlockParams(const std::string &block, const T &defaults) {
        T value = Resolve(StoredNode({system_name_, "blocks", block}), defaults,
                          system_name_ + ".blocks." + block);
        write_back_[system_name_]["blocks"][block] = YAML::Node(value);
        return value;
    }

    /**
     * @brief Effective system parameters: stored values over `defaults`
     *
     * Reads `<system>.params`.
     *
     * @throws ConfigError if the merged node cannot be decoded
     */
    [[nodiscard]] SystemParams GetSystemParams(const SystemParams &defaults);

    /**
     * @brief Write every effective value back to the file
     *
     * Other systems, and stored entries not requested this run, are kept.
     *
     * @throws IOError if the file cannot be written
     */
    void Save() const;

    /// The tree Save() would write
    [[nodiscard]] YAML::Node EffectiveTree() const;

    [[nodiscard]] const std::string &Path() const { return path_; }
    [[nodiscard]] const std::string &SystemName() const { return system_name_; }

    /// True if the file existed when the store was opened
    [[nodiscard]] bool Loaded() const { return loaded_; }

  private:
    template <typename T>
    T Resolve(const YAML::Node &stored, const T &defaults, const std::string &key) const {
        YAML::Node merged = detail::MergeNodes(YAML::Node(defaults), stored);
        try {
            return merged.as<T>();
        } catch (const YAML::Exception &e) {
            throw ConfigError(std::string("invalid parameter values: ") + e.what(), path_, key);
        }
    }

    /// Stored node at the given key path (Null if any level is missing)
    [[nodiscard]] YAML::Node StoredNode(const std::vector<std::string> &keys) const;

    std::string path_;
    std::string system_name_;
    bool loaded_ = false;
    YAML::Node file_;
    YAML::Node write_back_;
};

} // namespace sigflow
