#pragma once

/**
 * @file LogService.hpp
 * @brief Unified logging service for SigFlow
 *
 * Provides both immediate and buffered logging modes. The builder logs in
 * immediate mode; the runtime buffers everything logged during one step and
 * flushes at the end of the step.
 */

#include <sigflow/io/Console.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <iomanip>
#include <iterator>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sigflow {

// =============================================================================
// LogConfig
// =============================================================================

/**
 * @brief Logging configuration
 */
struct LogConfig {
    LogLevel console_level = LogLevel::Info;

    bool file_enabled = false;
    std::string file_path;
    LogLevel file_level = LogLevel::Debug;

    bool quiet_mode = false; ///< Suppress all but errors

    [[nodiscard]] static LogConfig Default() { return LogConfig{}; }

    /// Errors only
    [[nodiscard]] static LogConfig Quiet() {
        LogConfig config;
        config.console_level = LogLevel::Error;
        config.quiet_mode = true;
        return config;
    }

    /// Everything, to the console
    [[nodiscard]] static LogConfig Verbose() {
        LogConfig config;
        config.console_level = LogLevel::Trace;
        config.file_level = LogLevel::Trace;
        return config;
    }
};

// =============================================================================
// LogContext
// =============================================================================

/**
 * @brief Log context - set by the runtime around each block step
 *
 * Thread-local; blocks logging from Step() do not pass it explicitly.
 */
struct LogContext {
    std::string system; ///< System name (e.g., "cart")
    std::string block;  ///< Block name (e.g., "controller")
    std::string type;   ///< Block type (e.g., "Pid")

    /// "system.block", "block", or "system"
    [[nodiscard]] std::string FullPath() const {
        if (system.empty()) {
            return block;
        }
        if (block.empty()) {
            return system;
        }
        return system + "." + block;
    }

    [[nodiscard]] bool IsSet() const { return !system.empty() || !block.empty(); }
};

// =============================================================================
// LogEntry
// =============================================================================

/**
 * @brief A single log entry with full context
 */
struct LogEntry {
    LogLevel level;      ///< Severity level
    double sim_time;     ///< Simulated time when logged
    std::string message; ///< Log message
    LogContext context;  ///< System/block context

    std::chrono::steady_clock::time_point wall_time;

    static LogEntry Create(LogLevel level, double sim_time, std::string_view message,
                           const LogContext &ctx) {
        LogEntry entry;
        entry.level = level;
        entry.sim_time = sim_time;
        entry.message = std::string(message);
        entry.context = ctx;
        entry.wall_time = std::chrono::steady_clock::now();
        return entry;
    }

    /// Format for output: "[sim_time] [LVL] [system.block] message"
    [[nodiscard]] std::string Format(bool include_context = true) const {
        std::ostringstream oss;
        oss << "[" << std::fixed << std::setprecision(3) << sim_time << "] ";
        oss << LevelPrefix(level) << " ";
        if (include_context && context.IsSet()) {
            oss << "[" << context.FullPath() << "] ";
        }
        oss << message;
        return oss.str();
    }

    /// Format with colors (for terminal)
    [[nodiscard]] std::string FormatColored(const Console &console) const {
        std::ostringstream oss;
        oss << console.Colorize("[", AnsiColor::Dim);
        oss << std::fixed << std::setprecision(3) << sim_time;
        oss << console.Colorize("]", AnsiColor::Dim) << " ";
        oss << console.Colorize(LevelPrefix(level), LevelColor(level)) << " ";
        if (context.IsSet()) {
            oss << console.Colorize("[" + context.FullPath() + "]", AnsiColor::Cyan) << " ";
        }
        oss << message;
        return oss.str();
    }
};

// =============================================================================
// LogContextManager
// =============================================================================

/**
 * @brief Thread-local log context manager
 */
class LogContextManager {
  public:
    static void SetContext(const LogContext &ctx) { current_context_ = ctx; }
    static void ClearContext() { current_context_ = LogContext{}; }
    [[nodiscard]] static const LogContext &GetContext() { return current_context_; }

    /**
     * @brief RAII guard: installs a context, restores the previous one on exit
     */
    class ScopedContext {
      public:
        ScopedContext(const std::string &system, const std::string &block,
                      const std::string &type = "")
            : previous_(current_context_) {
            current_context_.system = system;
            current_context_.block = block;
            current_context_.type = type;
        }

        ~ScopedContext() { current_context_ = previous_; }

        ScopedContext(const ScopedContext &) = delete;
        ScopedContext &operator=(const ScopedContext &) = delete;
        ScopedContext(ScopedContext &&) = delete;
        ScopedContext &operator=(ScopedContext &&) = delete;

      private:
        LogContext previous_;
    };

  private:
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    static inline thread_local LogContext current_context_;
};

// =============================================================================
// LogService
// =============================================================================

/**
 * @brief Unified logging service
 *
 * ALL logging goes through this service. Two modes:
 *
 * 1. **Immediate mode** (building, setup): each entry is handed to the sinks
 *    as soon as it is logged.
 * 2. **Buffered mode** (stepping): entries are collected and flushed at the
 *    end of the step by BufferedScope.
 */
class LogService {
  public:
    /// Sink callback type: receives batch of entries to output
    using Sink = std::function<void(const std::vector<LogEntry> &)>;

    LogService() = default;

    // === Mode Control ===

    void SetImmediateMode(bool immediate) { immediate_mode_ = immediate; }
    [[nodiscard]] bool IsImmediateMode() const { return immediate_mode_; }

    /**
     * @brief RAII guard for buffered mode
     *
     * Switches to buffered mode on construction, flushes and restores the
     * previous mode on destruction (also when a step throws). Sink failures
     * never escape the destructor; they are counted by the service.
     */
    class BufferedScope {
      public:
        explicit BufferedScope(LogService &service)
            : service_(service), previous_mode_(service.immediate_mode_) {
            service_.SetImmediateMode(false);
        }

        ~BufferedScope() {
            service_.FlushAndClear();
            service_.SetImmediateMode(previous_mode_);
        }

        BufferedScope(const BufferedScope &) = delete;
        BufferedScope &operator=(const BufferedScope &) = delete;
        BufferedScope(BufferedScope &&) = delete;
        BufferedScope &operator=(BufferedScope &&) = delete;

      private:
        LogService &service_;
        bool previous_mode_;
    };

    // === Configuration ===

    /// Set minimum level (below this = dropped)
    void SetMinLevel(LogLevel level) { min_level_ = level; }
    [[nodiscard]] LogLevel GetMinLevel() const { return min_level_; }

    void AddSink(Sink sink) { sinks_.emplace_back(std::move(sink), LogLevel::Trace); }

    /// Add a sink that only receives entries at or above a level
    void AddSink(Sink sink, LogLevel min_level) { sinks_.emplace_back(std::move(sink), min_level); }

    void ClearSinks() { sinks_.clear(); }

    // === Logging API ===

    /// Log a message with the current thread-local context
    void Log(LogLevel level, double sim_time, std::string_view message) {
        Log(level, sim_time, message, LogContextManager::GetContext());
    }

    /// Log with explicit context
    void Log(LogLevel level, double sim_time, std::string_view message, const LogContext &ctx) {
        if (level < min_level_) {
            return;
        }

        auto entry = LogEntry::Create(level, sim_time, message, ctx);

        std::vector<std::pair<Sink, LogLevel>> sinks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level == LogLevel::Error) {
                ++error_count_;
            } else if (level == LogLevel::Fatal) {
                ++fatal_count_;
            }

            if (!immediate_mode_) {
                entries_.push_back(std::move(entry));
                return;
            }
            sinks = sinks_;
        }
        Deliver(sinks, {entry});
    }

    void Trace(double t, std::string_view msg) { Log(LogLevel::Trace, t, msg); }
    void Debug(double t, std::string_view msg) { Log(LogLevel::Debug, t, msg); }
    void Info(double t, std::string_view msg) { Log(LogLevel::Info, t, msg); }
    void Warning(double t, std::string_view msg) { Log(LogLevel::Warning, t, msg); }
    void Error(double t, std::string_view msg) { Log(LogLevel::Error, t, msg); }
    void Fatal(double t, std::string_view msg) { Log(LogLevel::Fatal, t, msg); }

    // === Flush Control ===

    /**
     * @brief Hand buffered entries to every sink (filtered by sink level)
     *
     * The pending entries are taken out under the lock and the sinks run
     * outside it, so a sink may log. A sink that throws is counted in
     * SinkFailureCount() and ErrorCount(); the other sinks still receive the
     * batch.
     */
    void Flush() {
        std::vector<LogEntry> pending;
        std::vector<std::pair<Sink, LogLevel>> sinks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (entries_.empty()) {
                return;
            }
            pending.swap(entries_);
            sinks = sinks_;
        }
        Deliver(sinks, pending);
    }

    void FlushAndClear() {
        Flush();
        Clear();
    }

    /// Discard pending entries without flushing
    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    // === Query API ===

    [[nodiscard]] std::size_t PendingCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]] std::vector<LogEntry> GetPending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    [[nodiscard]] std::vector<LogEntry> GetEntriesForBlock(std::string_view block) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<LogEntry> result;
        for (const auto &entry : entries_) {
            if (entry.context.block == block) {
                result.push_back(entry);
            }
        }
        return result;
    }

    [[nodiscard]] std::size_t ErrorCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_count_;
    }

    [[nodiscard]] std::size_t FatalCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fatal_count_;
    }

    /// Number of sink calls that threw
    [[nodiscard]] std::size_t SinkFailureCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sink_failure_count_;
    }

    [[nodiscard]] bool HasErrors() const { return ErrorCount() > 0; }

    void ResetErrorCounts() {
        std::lock_guard<std::mutex> lock(mutex_);
        error_count_ = 0;
        fatal_count_ = 0;
        sink_failure_count_ = 0;
    }

  private:
    /// Call each sink with the entries at or above its level (no lock held)
    void Deliver(const std::vector<std::pair<Sink, LogLevel>> &sinks,
                 const std::vector<LogEntry> &entries) {
        for (const auto &[sink, min_level] : sinks) {
            std::vector<LogEntry> filtered;
            filtered.reserve(entries.size());
            std::copy_if(entries.begin(), entries.end(), std::back_inserter(filtered),
                         [lvl = min_level](const LogEntry &e) { return e.level >= lvl; });
            if (filtered.empty()) {
                continue;
            }
            try {
                sink(filtered);
            } catch (const std::exception &) {
                std::lock_guard<std::mutex> lock(mutex_);
                ++sink_failure_count_;
                ++error_count_;
            }
        }
    }

    std::vector<LogEntry> entries_;
    std::vector<std::pair<Sink, LogLevel>> sinks_; ///< sink + min level
    LogLevel min_level_ = LogLevel::Info;
    bool immediate_mode_ = true;

    std::size_t error_count_ = 0;
    std::size_t fatal_count_ = 0;
    std::size_t sink_failure_count_ = 0;

    mutable std::mutex mutex_;
};

/**
 * @brief Global log service singleton
 */
inline LogService &GetLogService() {
    static LogService instance;
    return instance;
}

} // namespace sigflow

// =============================================================================
// Logging Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define SIGFLOW_LOG_TRACE(sim_time, msg) ::sigflow::GetLogService().Trace(sim_time, msg)
#define SIGFLOW_LOG_DEBUG(sim_time, msg) ::sigflow::GetLogService().Debug(sim_time, msg)
#define SIGFLOW_LOG_INFO(sim_time, msg) ::sigflow::GetLogService().Info(sim_time, msg)
#define SIGFLOW_LOG_WARN(sim_time, msg) ::sigflow::GetLogService().Warning(sim_time, msg)
#define SIGFLOW_LOG_ERROR(sim_time, msg) ::sigflow::GetLogService().Error(sim_time, msg)
// NOLINTEND(cppcoreguidelines-macro-usage)
