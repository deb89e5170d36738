#pragma once

/**
 * @file FileIO.hpp
 * @brief Small file helpers shared by the exporters and the parameter store
 */

#include <sigflow/core/Error.hpp>

#include <fstream>
#include <functional>
#include <string>

namespace sigflow::detail {

/**
 * @brief Open `path` for writing (truncating) and hand the stream to `writer`
 * @throws IOError if the file cannot be opened or written
 */
inline void WriteToFile(const std::string &path,
                        const std::function<void(std::ofstream &)> &writer) {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw IOError("open", path, "cannot open file for writing");
    }
    writer(file);
    file.flush();
    if (!file) {
        throw IOError("write", path, "write failed");
    }
}

} // namespace sigflow::detail
