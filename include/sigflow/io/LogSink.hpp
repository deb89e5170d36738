#pragma once

/**
 * @file LogSink.hpp
 * @brief Pre-built log sinks for common output destinations
 */

#include <sigflow/core/Error.hpp>
#include <sigflow/io/Console.hpp>
#include <sigflow/io/LogService.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace sigflow {

/**
 * @brief Factory for common log sinks
 */
class LogSinks {
  public:
    /// Console sink with colors (respects TTY detection)
    static LogService::Sink Console(const class Console &console) {
        return [&console](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                if (console.IsColorEnabled()) {
                    std::cout << entry.FormatColored(console) << "\n";
                } else {
                    std::cout << entry.Format() << "\n";
                }
            }
            std::cout.flush();
        };
    }

    /**
     * @brief Plain text file sink (appends)
     * @throws IOError if the file cannot be opened
     */
    static LogService::Sink File(const std::string &path) {
        auto file = OpenAppend(path);
        return [file](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                *file << entry.Format() << "\n";
            }
            file->flush();
        };
    }

    /**
     * @brief JSON Lines sink, one object per entry
     * @throws IOError if the file cannot be opened
     */
    static LogService::Sink JsonLines(const std::string &path) {
        auto file = OpenAppend(path);
        return [file](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                nlohmann::json j;
                j["time"] = entry.sim_time;
                j["level"] = LevelPrefix(entry.level);
                j["system"] = entry.context.system;
                j["block"] = entry.context.block;
                j["message"] = entry.message;
                *file << j.dump() << "\n";
            }
            file->flush();
        };
    }

    /// Null sink (for testing/benchmarking)
    static LogService::Sink Null() {
        return [](const std::vector<LogEntry> & /*entries*/) {};
    }

    /// Callback sink (custom handling)
    static LogService::Sink Callback(std::function<void(const LogEntry &)> handler) {
        return [handler = std::move(handler)](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                handler(entry);
            }
        };
    }

    /**
     * @brief Install console (and optionally file) sinks according to a LogConfig
     *
     * Replaces the service's existing sinks.
     */
    static void Apply(LogService &service, const LogConfig &config, const class Console &console) {
        service.ClearSinks();
        LogLevel console_level = config.quiet_mode ? LogLevel::Error : config.console_level;
        LogLevel min_level = console_level;
        service.AddSink(Console(console), console_level);
        if (config.file_enabled) {
            service.AddSink(File(config.file_path), config.file_level);
            min_level = std::min(min_level, config.file_level);
        }
        service.SetMinLevel(min_level);
    }

  private:
    static std::shared_ptr<std::ofstream> OpenAppend(const std::string &path) {
        auto file = std::make_shared<std::ofstream>(path, std::ios::app);
        if (!file->is_open()) {
            throw IOError("open", path, "cannot open log file for writing");
        }
        return file;
    }
};

} // namespace sigflow
