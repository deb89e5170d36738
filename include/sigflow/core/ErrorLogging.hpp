#pragma once

/**
 * @file ErrorLogging.hpp
 * @brief Integration between Error types and LogService
 *
 * Bridges Error.hpp and LogService.hpp: errors are logged where they are
 * detected, then thrown (or rethrown by the runtime).
 */

#include <sigflow/core/Error.hpp>
#include <sigflow/io/LogService.hpp>

#include <string>
#include <utility>

namespace sigflow {

/**
 * @brief Convert error severity to log level
 */
inline LogLevel SeverityToLogLevel(Severity severity) {
    switch (severity) {
    case Severity::INFO:
        return LogLevel::Info;
    case Severity::WARNING:
        return LogLevel::Warning;
    case Severity::ERROR:
        return LogLevel::Error;
    case Severity::FATAL:
        return LogLevel::Fatal;
    }
    return LogLevel::Error;
}

/**
 * @brief Log an error to the global LogService
 *
 * @param block Block name used as log context (empty keeps the current context)
 */
inline void LogError(const Error &error, double time = 0.0, const std::string &block = "") {
    auto record = error.toRecord(time, block);
    LogLevel level = SeverityToLogLevel(record.severity);

    if (!block.empty()) {
        LogContext ctx = LogContextManager::GetContext();
        ctx.block = block;
        GetLogService().Log(level, time, record.message, ctx);
    } else {
        GetLogService().Log(level, time, record.message);
    }
}

/**
 * @brief Throw an error after logging it
 *
 * Usage:
 * @code
 * ThrowAndLog(BuildError::DuplicateBlockName("adder"));
 * @endcode
 */
template <typename E>
[[noreturn]] void ThrowAndLog(E &&error, double time = 0.0, const std::string &block = "") {
    LogError(error, time, block);
    throw std::forward<E>(error);
}

} // namespace sigflow
