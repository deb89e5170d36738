#pragma once

/**
 * @file Console.hpp
 * @brief Console abstraction with ANSI color support
 *
 * Terminal-aware output used by the console log sink and the examples.
 */

#include <cstdio>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

#include <unistd.h>

namespace sigflow {

// =============================================================================
// LogLevel
// =============================================================================

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    Trace,   ///< Most verbose, per-step internals
    Debug,   ///< Wiring, graphs, execution order
    Info,    ///< Normal operation
    Warning, ///< Potential issues
    Error,   ///< Failed operations
    Fatal    ///< Internal consistency violated
};

/// Short fixed-width tag for a level ("[INF]")
inline const char *LevelPrefix(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "[TRC]";
    case LogLevel::Debug:
        return "[DBG]";
    case LogLevel::Info:
        return "[INF]";
    case LogLevel::Warning:
        return "[WRN]";
    case LogLevel::Error:
        return "[ERR]";
    case LogLevel::Fatal:
        return "[FTL]";
    }
    return "[???]";
}

// =============================================================================
// AnsiColor
// =============================================================================

/**
 * @brief ANSI color codes
 */
struct AnsiColor {
    static constexpr const char *Reset = "\033[0m";
    static constexpr const char *Bold = "\033[1m";
    static constexpr const char *Dim = "\033[2m";

    static constexpr const char *Red = "\033[31m";
    static constexpr const char *Green = "\033[32m";
    static constexpr const char *Yellow = "\033[33m";
    static constexpr const char *Cyan = "\033[36m";
    static constexpr const char *White = "\033[37m";
    static constexpr const char *Gray = "\033[90m";

    static constexpr const char *BgRed = "\033[41m";
};

/// Color used for a level's tag
inline const char *LevelColor(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return AnsiColor::Gray;
    case LogLevel::Debug:
        return AnsiColor::Cyan;
    case LogLevel::Info:
        return AnsiColor::White;
    case LogLevel::Warning:
        return AnsiColor::Yellow;
    case LogLevel::Error:
        return AnsiColor::Red;
    case LogLevel::Fatal:
        return AnsiColor::BgRed;
    }
    return AnsiColor::White;
}

// =============================================================================
// Console
// =============================================================================

/**
 * @brief Console output with color support
 *
 * Detects if stdout is a terminal and enables/disables ANSI colors accordingly.
 */
class Console {
  public:
    Console() : is_tty_(isatty(STDOUT_FILENO) != 0), color_enabled_(is_tty_) {}

    /// Check if stdout is a terminal (supports ANSI codes)
    [[nodiscard]] bool IsTerminal() const { return is_tty_; }

    /// Enable/disable color output (auto-detected by default)
    void SetColorEnabled(bool enabled) { color_enabled_ = enabled; }
    [[nodiscard]] bool IsColorEnabled() const { return color_enabled_; }

    /// Set minimum log level for output
    void SetLogLevel(LogLevel level) { min_level_ = level; }
    [[nodiscard]] LogLevel GetLogLevel() const { return min_level_; }

    void Info(std::string_view msg) { Log(LogLevel::Info, msg); }
    void Warning(std::string_view msg) { Log(LogLevel::Warning, msg); }
    void Error(std::string_view msg) { Log(LogLevel::Error, msg); }

    /// Log with explicit level
    void Log(LogLevel level, std::string_view msg) {
        if (level < min_level_) {
            return;
        }
        std::cout << Colorize(LevelPrefix(level), LevelColor(level)) << " " << msg << "\n";
    }

    /// Log with a simulated-time prefix
    void LogTimed(LogLevel level, double sim_time, std::string_view msg) {
        if (level < min_level_) {
            return;
        }
        std::ostringstream oss;
        oss << "[" << std::fixed << std::setprecision(3) << sim_time << "] ";
        std::cout << oss.str() << Colorize(LevelPrefix(level), LevelColor(level)) << " " << msg
                  << "\n";
    }

    /// Apply color if enabled
    [[nodiscard]] std::string Colorize(std::string_view text, const char *color) const {
        if (!color_enabled_) {
            return std::string(text);
        }
        return std::string(color) + std::string(text) + AnsiColor::Reset;
    }

    /// Create horizontal rule
    [[nodiscard]] static std::string HorizontalRule(int width = 80, char c = '-') {
        return std::string(static_cast<std::size_t>(width), c);
    }

    /// Pad string to width (left-aligned text)
    [[nodiscard]] static std::string PadRight(std::string_view text, std::size_t width) {
        if (text.size() >= width) {
            return std::string(text);
        }
        return std::string(text) + std::string(width - text.size(), ' ');
    }

    /// Format a number with fixed precision
    [[nodiscard]] static std::string FormatNumber(double value, int precision = 2) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision) << value;
        return oss.str();
    }

    void WriteLine(std::string_view text = "") const { std::cout << text << "\n"; }

    void Flush() const { std::cout.flush(); }

  private:
    bool is_tty_ = false;
    bool color_enabled_ = false;
    LogLevel min_level_ = LogLevel::Info;
};

} // namespace sigflow
