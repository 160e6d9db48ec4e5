#pragma once

#include "Platform.hpp"
#include "Types.hpp"

HB_DISABLE_WARNINGS_PUSH
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
HB_DISABLE_WARNINGS_POP

#include <memory>

// ============================================================================
// Logging System Facade
// spdlog wrapper with multiple severity levels
// ============================================================================

namespace h5bind {

/// Centralized logging system using spdlog backend
class HB_API Log {
public:
    /// Log severity levels
    enum class Level {
        Trace,    // Verbose debugging info
        Debug,    // Development-time diagnostic
        Info,     // General informational messages
        Warn,     // Warnings (non-critical issues)
        Error,    // Errors (resolution failures)
        Critical, // Critical errors (program-terminating)
        Off       // Disable logging
    };

    /// Initialize the logging system with console and file output
    /// @param logFilePath Optional path to log file (nullptr or "" = console only)
    /// @param level Minimum severity level to display
    static void Init(const char* logFilePath = "h5bind.log", Level level = Level::Info);

    /// Shutdown the logging system (flushes buffers)
    static void Shutdown();

    /// Set the global log level at runtime
    static void SetLevel(Level level);

    /// Retrieve the current log level
    static Level GetLevel();

    /// Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
    static Optional<Level> ParseLevel(StringView name);

    // ========================================================================
    // Templated Logging Interface (supports fmt-style formatting)
    // Messages logged before Init() are dropped.
    // ========================================================================

    template<typename... Args>
    static void Trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (s_Logger) s_Logger->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (s_Logger) s_Logger->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (s_Logger) s_Logger->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (s_Logger) s_Logger->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (s_Logger) s_Logger->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (s_Logger) s_Logger->critical(fmt, std::forward<Args>(args)...);
    }

    /// Flush all log buffers immediately
    static void Flush();

private:
    static std::shared_ptr<spdlog::logger> s_Logger;
};

} // namespace h5bind

// ============================================================================
// Convenience Macros
// ============================================================================

#define HB_LOG_TRACE(...)    ::h5bind::Log::Trace(__VA_ARGS__)
#define HB_LOG_DEBUG(...)    ::h5bind::Log::Debug(__VA_ARGS__)
#define HB_LOG_INFO(...)     ::h5bind::Log::Info(__VA_ARGS__)
#define HB_LOG_WARN(...)     ::h5bind::Log::Warn(__VA_ARGS__)
#define HB_LOG_ERROR(...)    ::h5bind::Log::Error(__VA_ARGS__)
#define HB_LOG_CRITICAL(...) ::h5bind::Log::Critical(__VA_ARGS__)
