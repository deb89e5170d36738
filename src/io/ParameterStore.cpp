/**
 * @file ParameterStore.cpp
 * @brief YAML parameter store implementation
 */

#include <sigflow/io/FileIO.hpp>
#include <sigflow/io/LogService.hpp>
#include <sigflow/io/ParameterStore.hpp>

#include <filesystem>
#include <utility>

namespace sigflow {

namespace detail {

YAML::Node MergeNodes(const YAML::Node &base, const YAML::Node &overlay) {
    if (!overlay.IsDefined() || overlay.IsNull()) {
        return YAML::Clone(base);
    }
    if (!base.IsDefined() || !base.IsMap() || !overlay.IsMap()) {
        return YAML::Clone(overlay);
    }

    YAML::Node result = YAML::Clone(base);
    for (const auto &entry : overlay) {
        const auto key = entry.first.as<std::string>();
        result[key] = MergeNodes(base[key], entry.second);
    }
    return result;
}

} // namespace detail

ParameterStore::ParameterStore(std::string path, std::string system_name)
    : path_(std::move(path)), system_name_(std::move(system_name)) {
    if (std::filesystem::exists(path_)) {
        try {
            file_ = YAML::LoadFile(path_);
        } catch (const YAML::Exception &e) {
            throw ConfigError(std::string("failed to parse parameter file: ") + e.what(), path_,
                              "");
        }
        loaded_ = true;
        SIGFLOW_LOG_DEBUG(0.0, "Loaded parameters for '" + system_name_ + "' from " + path_);
    }

    write_back_[system_name_]["blocks"] = YAML::Node(YAML::NodeType::Map);
}

SystemParams ParameterStore::GetSystemParams(const SystemParams &defaults) {
    SystemParams value =
        Resolve(StoredNode({system_name_, "params"}), defaults, system_name_ + ".params");
    write_back_[system_name_]["params"] = YAML::Node(value);
    return value;
}

YAML::Node ParameterStore::StoredNode(const std::vector<std::string> &keys) const {
    YAML::Node current;
    current.reset(file_);
    for (const auto &key : keys) {
        if (!current.IsMap()) {
            return YAML::Node();
        }
        const YAML::Node &view = current;
        YAML::Node child = view[key];
        if (!child.IsDefined()) {
            return YAML::Node();
        }
        current.reset(child);
    }
    return current;
}

YAML::Node ParameterStore::EffectiveTree() const {
    YAML::Node tree = file_.IsMap() ? YAML::Clone(file_) : YAML::Node(YAML::NodeType::Map);
    // Stored entries nobody asked for this run are kept as they were
    tree[system_name_] = detail::MergeNodes(StoredNode({system_name_}), write_back_[system_name_]);
    return tree;
}

void ParameterStore::Save() const {
    YAML::Emitter out;
    out << EffectiveTree();
    detail::WriteToFile(path_, [&](std::ofstream &file) { file << out.c_str() << "\n"; });
    SIGFLOW_LOG_DEBUG(0.0, "Saved parameters for '" + system_name_ + "' to " + path_);
}

} // namespace sigflow
